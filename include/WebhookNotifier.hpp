#pragma once

#include "Cancellation.hpp"
#include "RetryExecutor.hpp"
#include "RetryState.hpp"
#include "RetryStrategies.hpp"
#include "Settings.hpp"
#include "Transport.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace http_notifier {

/**
 * Posts JSON notifications to webhook endpoints with retries.
 *
 * Each notify() is one logical call: one POST per attempt, classified by the
 * status code, with server-directed delays fed back through RetryState.
 * Concurrent notify() calls are fine as long as they target different URLs.
 */
class WebhookNotifier {
public:
	explicit WebhookNotifier(std::shared_ptr<Transport> transport, RetryPolicy retryPolicy = RetryPolicy(),
							 RequestPolicy requestPolicy = RequestPolicy(), SleepFn sleep = nullptr);
	// `settings` must outlive the notifier
	WebhookNotifier(const Settings& settings, std::shared_ptr<Transport> transport, SleepFn sleep = nullptr);

	// non-copyable
	WebhookNotifier(const WebhookNotifier&) = delete;
	WebhookNotifier& operator=(const WebhookNotifier&) = delete;

	// Returns the delivered response body, throws RetryError
	std::string notify(const Endpoint& endpoint, nlohmann::json payload, CancellationToken* cancel = nullptr);
	// Resolves `target` through the Settings this notifier was built with
	std::string notify(const std::string& target, nlohmann::json payload, CancellationToken* cancel = nullptr);

	std::vector<Attempt> lastAttempts() const;
	RetryStatistics lastStatistics() const;

	RetryState& retryState() { return retryState_; }
	const RetryPolicy& retryPolicy() const { return retryPolicy_; }

	void setIdempotencyKey(bool enabled) { idempotencyKey_ = enabled; }

	// Adds "#channel" to the payload when the endpoint names one
	static nlohmann::json withChannel(nlohmann::json payload, const std::string& channel);

private:
	std::shared_ptr<Transport> transport_;
	const RetryPolicy retryPolicy_;
	const RequestPolicy requestPolicy_;
	SleepFn sleep_;
	const Settings* settings_ = nullptr;
	bool idempotencyKey_ = true;

	RetryState retryState_;

	mutable std::mutex mutex_;
	std::vector<Attempt> lastAttempts_;

	Outcome attempt(const HttpRequest& request);
	void record(const std::vector<Attempt>& attempts);
};

} // namespace http_notifier
