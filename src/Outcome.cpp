#include "Outcome.hpp"

namespace http_notifier {

std::string_view toString(FailureKind kind) {
	switch (kind) {
		case FailureKind::TransientServerError: return "TransientServerError";
		case FailureKind::RateLimited: return "RateLimited";
		case FailureKind::ClientRejected: return "ClientRejected";
		case FailureKind::TransportError: return "TransportError";
	}
	return "Unknown";
}

std::string reasonOf(const Outcome& outcome) {
	if (auto* f = std::get_if<RetryableFailure>(&outcome))
		return f->reason;
	if (auto* f = std::get_if<FatalFailure>(&outcome))
		return f->reason;
	return {};
}

std::optional<FailureKind> failureKindOf(const Outcome& outcome) {
	if (auto* f = std::get_if<RetryableFailure>(&outcome))
		return f->kind;
	if (auto* f = std::get_if<FatalFailure>(&outcome))
		return f->kind;
	return std::nullopt;
}

RetryStatistics RetryStatistics::from(const std::vector<Attempt>& attempts) {
	RetryStatistics stats;
	if (attempts.empty())
		return stats;

	stats.attemptNumber = static_cast<uint32_t>(attempts.size());
	stats.startTime = attempts.front().startedAt;
	stats.delaySinceFirstAttempt = attempts.back().startedAt - attempts.front().startedAt;
	for (const auto& attempt : attempts)
		stats.idleFor += attempt.delay;
	return stats;
}

} // namespace http_notifier
