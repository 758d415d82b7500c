#pragma once

#include "Outcome.hpp"

#include <cstdint>
#include <functional>
#include <optional>

namespace http_notifier {

// Upper bound in seconds for a server-directed delay (Retry-After)
constexpr double MAX_SERVER_DELAY = 3600.0;

/**
 * Type alias for retry predicate.
 * Returns true if a failed attempt may be followed by another one.
 */
using RetryPredicateFn = std::function<bool(const Outcome&)>;

/**
 * Default schedule: delay in seconds after the given 1-based attempt.
 */
using BackoffFn = std::function<double(uint32_t attempt)>;

/**
 * Full wait strategy: delay in seconds after the given attempt.
 * `override` is a server-directed delay already taken from RetryState, if any.
 */
using WaitStrategyFn = std::function<double(uint32_t attempt, std::optional<double> override)>;

/**
 * Configuration for retry behavior.
 * Built once per caller and only read afterwards.
 */
struct RetryPolicy {
    uint32_t maxAttempts = 4;                       // Total attempts including the first one, >= 1
    float totalTimeout = 0;                         // Seconds from first attempt, 0 = no limit

    WaitStrategyFn wait;                            // Delay between attempts
    RetryPredicateFn shouldRetry;                   // Consulted for RetryableFailure only

    // Default constructor - retryable outcomes, server-directed exponential backoff
    // Defined in RetryStrategies.hpp after factory functions are available
    RetryPolicy();
};

} // namespace http_notifier
