#include "RetryExecutor.hpp"
#include "utils.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace http_notifier {

RetryExecutor::RetryExecutor(RetryState& state, SleepFn sleep)
	: state_(state), sleep_(std::move(sleep)) {}

const std::vector<Attempt>& RetryExecutor::attempts() const {
	return this->attempts_;
}

RetryStatistics RetryExecutor::statistics() const {
	return RetryStatistics::from(this->attempts_);
}

bool RetryExecutor::wait(double seconds, CancellationToken* cancel) {
	if (this->sleep_)
		return this->sleep_(seconds) && !(cancel && cancel->isCancelled());
	if (cancel)
		return cancel->waitFor(seconds);

	CancellationToken never;
	return never.waitFor(seconds);
}

void RetryExecutor::fail(ErrorKind kind, const Outcome& last) {
	std::string reason = reasonOf(last);
	spdlog::warn("Giving up after {} attempt(s): {} - {}", this->attempts_.size(), toString(kind), reason);
	throw RetryError(kind, std::move(reason), this->attempts_, failureKindOf(last));
}

std::string RetryExecutor::execute(const Operation& operation, const RetryPolicy& policy,
								   CancellationToken* cancel) {
	if (policy.maxAttempts < 1)
		throw std::invalid_argument("RetryPolicy::maxAttempts must be >= 1");
	if (!operation.call)
		throw std::invalid_argument("Operation has no callable");

	this->attempts_.clear();
	const double firstAttemptAt = util::current_time();

	for (uint32_t i = 1; i <= policy.maxAttempts; ++i) {
		if (cancel && cancel->isCancelled()) {
			throw RetryError(ErrorKind::Cancelled, "cancelled before attempt " + std::to_string(i),
							 this->attempts_,
							 this->attempts_.empty() ? std::nullopt : failureKindOf(this->attempts_.back().outcome));
		}

		spdlog::debug("Starting attempt {}/{} of '{}'", i, policy.maxAttempts, operation.id);

		Attempt attempt;
		attempt.index = i;
		attempt.startedAt = util::current_time();
		attempt.outcome = operation.call();
		this->attempts_.push_back(attempt);

		const Outcome& outcome = this->attempts_.back().outcome;

		if (auto* success = std::get_if<Success>(&outcome)) {
			spdlog::debug("Attempt {} of '{}' succeeded", i, operation.id);
			return success->body;
		}

		if (auto* fatal = std::get_if<FatalFailure>(&outcome)) {
			// A hint left behind by this run must not leak into the next one
			this->state_.clear(operation.id);
			this->fail(toErrorKind(fatal->kind), outcome);
		}

		const auto& failure = std::get<RetryableFailure>(outcome);
		if (policy.shouldRetry && !policy.shouldRetry(outcome)) {
			this->state_.clear(operation.id);
			this->fail(toErrorKind(failure.kind), outcome);
		}

		const bool timedOut = policy.totalTimeout > 0 &&
			util::current_time() - firstAttemptAt >= policy.totalTimeout;
		if (i == policy.maxAttempts || timedOut) {
			this->state_.clear(operation.id);
			this->fail(ErrorKind::RetriesExhausted, outcome);
		}

		std::optional<double> override = this->state_.takeAndClear(operation.id);
		double delay = policy.wait ? policy.wait(i, override) : override.value_or(0.0);
		this->attempts_.back().delay = delay;

		spdlog::info("Attempt {}/{} of '{}' failed ({}): {}. Retrying in {:.3f}s{}",
					 i, policy.maxAttempts, operation.id, toString(failure.kind), failure.reason, delay,
					 override ? " (server-directed)" : "");

		if (!this->wait(delay, cancel)) {
			throw RetryError(ErrorKind::Cancelled, "cancelled while waiting for attempt " + std::to_string(i + 1),
							 this->attempts_, failure.kind);
		}
	}

	// maxAttempts >= 1 guarantees one of the branches above returned or threw
	throw std::logic_error("RetryExecutor: attempt loop fell through");
}

} // namespace http_notifier
