#include "RetryState.hpp"

namespace http_notifier {

void RetryState::set(const std::string& id, double delay) {
	std::lock_guard<std::mutex> lk(this->mutex_);
	this->overrides_[id] = delay;
}

std::optional<double> RetryState::takeAndClear(const std::string& id) {
	std::lock_guard<std::mutex> lk(this->mutex_);
	auto it = this->overrides_.find(id);
	if (it == this->overrides_.end())
		return std::nullopt;

	double delay = it->second;
	this->overrides_.erase(it);
	return delay;
}

std::optional<double> RetryState::pending(const std::string& id) const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	auto it = this->overrides_.find(id);
	if (it == this->overrides_.end())
		return std::nullopt;
	return it->second;
}

void RetryState::clear(const std::string& id) {
	std::lock_guard<std::mutex> lk(this->mutex_);
	this->overrides_.erase(id);
}

bool RetryState::empty() const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	return this->overrides_.empty();
}

} // namespace http_notifier
