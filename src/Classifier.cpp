#include "Classifier.hpp"
#include "RetryPolicy.hpp"
#include "utils.hpp"

#include <algorithm>
#include <charconv>

#include <fmt/format.h>

namespace http_notifier {

namespace {

std::string make_reason(long status, const std::string& body) {
	if (body.empty())
		return fmt::format("HTTP {}", status);
	return fmt::format("HTTP {} - {}", status, body);
}

} // namespace

std::optional<double> parseRetryAfter(std::string_view value) {
	value = util::trim(value);
	if (value.empty())
		return std::nullopt;

	long seconds = 0;
	auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
	if (ptr != value.data() + value.size() || value.front() == '-')
		return std::nullopt;
	// too many digits for a long: still a valid, very long delay
	if (ec == std::errc::result_out_of_range)
		return MAX_SERVER_DELAY;
	if (ec != std::errc() || seconds < 0)
		return std::nullopt;
	return std::min(static_cast<double>(seconds), MAX_SERVER_DELAY);
}

Outcome classify(long status, const std::vector<std::string>& headers, std::string body) {
	if (status >= 200 && status < 300)
		return Success{std::move(body), status};

	if (status == TOO_MANY_REQUESTS) {
		RetryableFailure failure{FailureKind::RateLimited, make_reason(status, body), status, std::nullopt};
		if (auto retryAfter = util::findHeader(headers, "Retry-After"))
			failure.suggestedDelay = parseRetryAfter(*retryAfter);
		return failure;
	}

	if (status >= 500 && status < 600)
		return RetryableFailure{FailureKind::TransientServerError, make_reason(status, body), status, std::nullopt};

	return FatalFailure{FailureKind::ClientRejected, make_reason(status, body), status};
}

Outcome classifyTransportError(std::string_view message) {
	return RetryableFailure{FailureKind::TransportError, fmt::format("transport error: {}", message), 0, std::nullopt};
}

} // namespace http_notifier
