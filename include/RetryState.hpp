#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace http_notifier {

/**
 * One-shot server-directed delays, keyed by callable identity (e.g. the target URL).
 *
 * The caller sets a delay when the server hints one; the executor takes it for the
 * attempt that immediately follows. Taking clears the slot, so later attempts fall
 * back to the default schedule unless the server hints again.
 */
class RetryState {
public:
	RetryState() = default;

	// non-copyable
	RetryState(const RetryState&) = delete;
	RetryState& operator=(const RetryState&) = delete;

	// Last write wins
	void set(const std::string& id, double delay);

	std::optional<double> takeAndClear(const std::string& id);

	std::optional<double> pending(const std::string& id) const;
	void clear(const std::string& id);
	bool empty() const;

private:
	mutable std::mutex mutex_;
	std::unordered_map<std::string, double> overrides_;
};

} // namespace http_notifier
