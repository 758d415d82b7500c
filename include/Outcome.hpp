#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace http_notifier {

enum class FailureKind : uint8_t {
    TransientServerError,   // 5xx
    RateLimited,            // 429
    ClientRejected,         // any other non-2xx
    TransportError          // no HTTP response at all
};

std::string_view toString(FailureKind kind);

struct Success {
    std::string body;
    long status = 200;
};

struct RetryableFailure {
    FailureKind kind = FailureKind::TransientServerError;
    std::string reason;
    long status = 0;                                // 0 for transport errors
    std::optional<double> suggestedDelay;           // server-directed delay in seconds
};

struct FatalFailure {
    FailureKind kind = FailureKind::ClientRejected;
    std::string reason;
    long status = 0;
};

/**
 * Classified result of a single attempt.
 * Produced once per attempt and never mutated afterwards.
 */
using Outcome = std::variant<Success, RetryableFailure, FatalFailure>;

inline bool isSuccess(const Outcome& outcome) {
    return std::holds_alternative<Success>(outcome);
}

inline bool isRetryable(const Outcome& outcome) {
    return std::holds_alternative<RetryableFailure>(outcome);
}

inline bool isFatal(const Outcome& outcome) {
    return std::holds_alternative<FatalFailure>(outcome);
}

// Empty for Success
std::string reasonOf(const Outcome& outcome);

// nullopt for Success
std::optional<FailureKind> failureKindOf(const Outcome& outcome);

/**
 * Record of a single attempt.
 */
struct Attempt {
    uint32_t index = 1;                             // 1-based
    double startedAt = 0;                           // seconds since epoch
    Outcome outcome;
    double delay = 0;                               // wait chosen after this attempt, 0 if none
};

/**
 * Per-run statistics derived from the attempt sequence.
 */
struct RetryStatistics {
    uint32_t attemptNumber = 0;                     // attempts made
    double startTime = 0;                           // first attempt start, seconds since epoch
    double idleFor = 0;                             // total time spent waiting between attempts
    double delaySinceFirstAttempt = 0;              // last attempt start minus first attempt start

    static RetryStatistics from(const std::vector<Attempt>& attempts);
};

} // namespace http_notifier
