#pragma once

#include "RetryPolicy.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <vector>

namespace http_notifier {
namespace retry {

// ============ Retry Predicates ============

/**
 * Default predicate: retry whatever the classifier marked retryable.
 */
inline RetryPredicateFn retryableOutcome() {
    return [](const Outcome& outcome) -> bool {
        return isRetryable(outcome);
    };
}

/**
 * Retry only failures of the given kinds.
 */
inline RetryPredicateFn failureKinds(std::set<FailureKind> kinds) {
    return [kinds = std::move(kinds)](const Outcome& outcome) -> bool {
        auto kind = failureKindOf(outcome);
        return kind && kinds.count(*kind) > 0;
    };
}

/**
 * Retry on specific HTTP status codes.
 * Default: 429 (Too Many Requests), 500, 502, 503, 504 (Server Errors)
 */
inline RetryPredicateFn httpStatus(std::set<long> codes = {429, 500, 502, 503, 504}) {
    return [codes = std::move(codes)](const Outcome& outcome) -> bool {
        if (auto* f = std::get_if<RetryableFailure>(&outcome))
            return codes.count(f->status) > 0;
        if (auto* f = std::get_if<FatalFailure>(&outcome))
            return codes.count(f->status) > 0;
        return false;
    };
}

// SAFINAE predictor for RetryPredicateFn
template <class Fn>
using is_retry_pred = std::is_invocable_r<bool, Fn&, const Outcome&>;

/**
 * Combine multiple predicates with OR logic.
 */
template <class... Fns,
          std::enable_if_t<
              (sizeof...(Fns) > 0) &&
              (is_retry_pred<std::decay_t<Fns>>::value && ...) &&
              (std::is_copy_constructible_v<std::decay_t<Fns>> && ...),
              int> = 0>
inline RetryPredicateFn anyOf(Fns&&... fns) {
    return [fs = std::tuple<std::decay_t<Fns>...>(std::forward<Fns>(fns)...)]
           (const Outcome& outcome) -> bool {
        return std::apply(
            [&](auto&... g) { return ((static_cast<bool>(g(outcome))) || ...); },
            fs
        );
    };
}

/**
 * Combine multiple predicates with AND logic.
 */
template <class... Fns,
          std::enable_if_t<
              (sizeof...(Fns) > 0) &&
              (is_retry_pred<std::decay_t<Fns>>::value && ...) &&
              (std::is_copy_constructible_v<std::decay_t<Fns>> && ...),
              int> = 0>
inline RetryPredicateFn allOf(Fns&&... fns) {
    return [fs = std::tuple<std::decay_t<Fns>...>(std::forward<Fns>(fns)...)]
           (const Outcome& outcome) -> bool {
        return std::apply(
            [&](auto&... g) { return ((static_cast<bool>(g(outcome))) && ...); },
            fs
        );
    };
}

// ============ Backoff Schedules ============
// All return a delay in seconds after the given 1-based attempt

/**
 * Exponential backoff.
 * delay = clamp(multiplier * 2^(attempt - 1), minDelay, maxDelay)
 */
inline BackoffFn exponentialBackoff(
    double multiplier = 1.0,
    double minDelay = 0.0,
    double maxDelay = 10.0)
{
    return [=](uint32_t attempt) -> double {
        double exp = std::pow(2.0, static_cast<double>(std::max<uint32_t>(attempt, 1) - 1));
        double delay = multiplier * exp;
        if (!std::isfinite(delay))
            delay = maxDelay;
        return std::clamp(delay, minDelay, std::max(minDelay, maxDelay));
    };
}

/**
 * Fixed delay between attempts.
 */
inline BackoffFn fixedDelay(double delay = 1.0) {
    return [delay](uint32_t) -> double {
        return delay;
    };
}

/**
 * Step chain: delays[attempt - 1], the last entry repeats.
 * e.g. {1, 1, 3, 3, 6}
 */
inline BackoffFn fixedChain(std::vector<double> delays) {
    if (delays.empty())
        throw std::invalid_argument("fixedChain: empty delay list");
    return [delays = std::move(delays)](uint32_t attempt) -> double {
        size_t i = attempt > 0 ? attempt - 1 : 0;
        return delays[std::min(i, delays.size() - 1)];
    };
}

/**
 * Linear backoff: delay increases linearly with each attempt.
 * delay = min(initialDelay + increment * (attempt - 1), maxDelay)
 */
inline BackoffFn linearBackoff(
    double initialDelay = 1.0,
    double increment = 1.0,
    double maxDelay = 10.0)
{
    return [=](uint32_t attempt) -> double {
        double delay = initialDelay + increment * static_cast<double>(attempt > 0 ? attempt - 1 : 0);
        return std::min(delay, maxDelay);
    };
}

/**
 * Immediate retry - no delay.
 */
inline BackoffFn immediate() {
    return [](uint32_t) -> double {
        return 0.0;
    };
}

/**
 * Source of jitter: returns a value in [-max, max].
 */
using JitterSource = std::function<double(double max)>;

/**
 * Add jitter to a schedule. The source is explicit so that tests stay deterministic.
 * delay = max(0, backoff(attempt) + source(backoff(attempt) * jitterFactor))
 */
inline BackoffFn withJitter(BackoffFn backoff, double jitterFactor = 0.3,
                            JitterSource source = util::jitter_generator) {
    return [backoff = std::move(backoff), jitterFactor, source = std::move(source)](uint32_t attempt) -> double {
        double delay = backoff(attempt);
        if (jitterFactor > 0 && source)
            delay += source(delay * jitterFactor);
        return std::max(0.0, delay);
    };
}

// ============ Wait Strategies ============

/**
 * Server-directed override on top of a default schedule.
 * A pending override wins for exactly the attempt it was taken for,
 * clamped to [0, maxOverride].
 */
inline WaitStrategyFn serverDirected(BackoffFn fallback, double maxOverride = MAX_SERVER_DELAY) {
    return [fallback = std::move(fallback), maxOverride](uint32_t attempt, std::optional<double> override) -> double {
        if (override) {
            if (std::isnan(*override))
                return fallback(attempt);
            return std::clamp(*override, 0.0, std::max(0.0, maxOverride));
        }
        return fallback(attempt);
    };
}

/**
 * Ignore server hints entirely.
 */
inline WaitStrategyFn scheduleOnly(BackoffFn backoff) {
    return [backoff = std::move(backoff)](uint32_t attempt, std::optional<double>) -> double {
        return backoff(attempt);
    };
}

} // namespace retry

// Default constructor implementation for RetryPolicy
inline RetryPolicy::RetryPolicy()
    : maxAttempts(4)
    , totalTimeout(0)
    , wait(retry::serverDirected(retry::exponentialBackoff()))
    , shouldRetry(retry::retryableOutcome())
{}

} // namespace http_notifier
