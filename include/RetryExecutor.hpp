#pragma once

#include "Cancellation.hpp"
#include "Errors.hpp"
#include "Outcome.hpp"
#include "RetryPolicy.hpp"
#include "RetryState.hpp"

#include <functional>
#include <string>
#include <vector>

namespace http_notifier {

/**
 * The retried operation: one attempt per call, classified by the operation itself.
 * `id` keys the operation's slot in RetryState.
 */
struct Operation {
	std::string id;
	std::function<Outcome()> call;
};

/**
 * Blocks for the given number of seconds.
 * Returns false if the wait was cancelled.
 */
using SleepFn = std::function<bool(double seconds)>;

/**
 * Drives the attempt loop for one logical call at a time.
 *
 * Attempting(i) -> Succeeded        on Success, returns the body
 *               -> Fatal            on FatalFailure or a failure the policy refuses to retry
 *               -> ExhaustedRetries on RetryableFailure at maxAttempts or past totalTimeout
 *               -> Attempting(i+1)  otherwise, after policy.wait(i, state.takeAndClear(id))
 *
 * Terminal failures throw RetryError. The attempt sequence of the last run stays
 * available through attempts() either way.
 */
class RetryExecutor {
public:
	// Without a SleepFn the executor waits on the run's CancellationToken
	explicit RetryExecutor(RetryState& state, SleepFn sleep = nullptr);

	std::string execute(const Operation& operation, const RetryPolicy& policy,
						CancellationToken* cancel = nullptr);

	const std::vector<Attempt>& attempts() const;
	RetryStatistics statistics() const;

private:
	RetryState& state_;
	SleepFn sleep_;
	std::vector<Attempt> attempts_;

	bool wait(double seconds, CancellationToken* cancel);

	[[noreturn]] void fail(ErrorKind kind, const Outcome& last);
};

} // namespace http_notifier
