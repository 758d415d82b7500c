#pragma once

#include "Outcome.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace http_notifier {

constexpr long TOO_MANY_REQUESTS = 429;

/**
 * Map a raw HTTP response to an Outcome.
 *
 *   2xx          -> Success
 *   429          -> RetryableFailure(RateLimited), Retry-After seconds as suggested delay
 *   5xx          -> RetryableFailure(TransientServerError)
 *   anything else -> FatalFailure(ClientRejected)
 *
 * `headers` are raw "Name: value" lines.
 */
Outcome classify(long status, const std::vector<std::string>& headers, std::string body = {});

// A request that never got an HTTP response. Always retryable.
Outcome classifyTransportError(std::string_view message);

// Integer seconds only, capped at MAX_SERVER_DELAY; HTTP-date and garbage yield nullopt.
std::optional<double> parseRetryAfter(std::string_view value);

} // namespace http_notifier
