#include "WebhookNotifier.hpp"
#include "Classifier.hpp"
#include "Errors.hpp"
#include "IdempotencyKey.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace http_notifier {

WebhookNotifier::WebhookNotifier(std::shared_ptr<Transport> transport, RetryPolicy retryPolicy,
								 RequestPolicy requestPolicy, SleepFn sleep)
	: transport_(std::move(transport)), retryPolicy_(std::move(retryPolicy)),
	  requestPolicy_(std::move(requestPolicy)), sleep_(std::move(sleep)) {
	if (!this->transport_)
		throw std::invalid_argument("WebhookNotifier: null transport");
}

WebhookNotifier::WebhookNotifier(const Settings& settings, std::shared_ptr<Transport> transport, SleepFn sleep)
	: WebhookNotifier(std::move(transport), settings.retryPolicy, settings.requestPolicy, std::move(sleep)) {
	this->settings_ = &settings;
	this->idempotencyKey_ = settings.idempotencyKey;
}

nlohmann::json WebhookNotifier::withChannel(nlohmann::json payload, const std::string& channel) {
	if (channel.empty())
		return payload;
	if (!payload.is_object())
		throw std::invalid_argument("WebhookNotifier: payload must be a JSON object");

	payload["channel"] = channel.front() == '#' ? channel : "#" + channel;
	return payload;
}

Outcome WebhookNotifier::attempt(const HttpRequest& request) {
	HttpResponse response = this->transport_->send(request, this->requestPolicy_);

	if (!response.error.empty()) {
		spdlog::info("POST {}: {}", request.url, response.error);
		return classifyTransportError(response.error);
	}

	Outcome outcome = classify(response.status, response.headers, std::move(response.body));

	if (auto* failure = std::get_if<RetryableFailure>(&outcome)) {
		spdlog::info("POST {}: {}", request.url, failure->reason);
		// Queue the server's hint for the attempt that follows
		if (failure->kind == FailureKind::RateLimited && failure->suggestedDelay)
			this->retryState_.set(request.url, *failure->suggestedDelay);
	} else if (auto* fatal = std::get_if<FatalFailure>(&outcome)) {
		spdlog::info("POST {}: {}", request.url, fatal->reason);
	}
	return outcome;
}

void WebhookNotifier::record(const std::vector<Attempt>& attempts) {
	std::lock_guard<std::mutex> lk(this->mutex_);
	this->lastAttempts_ = attempts;
}

std::string WebhookNotifier::notify(const Endpoint& endpoint, nlohmann::json payload, CancellationToken* cancel) {
	HttpRequest request;
	request.url = endpoint.url;
	request.body = withChannel(std::move(payload), endpoint.channel).dump();
	request.headers = {"Content-Type: application/json"};
	if (this->idempotencyKey_)
		request.headers.push_back("Idempotency-Key: " + idempotencyKey(request.url, request.body));

	Operation operation{request.url, [this, &request]() { return this->attempt(request); }};

	RetryExecutor executor(this->retryState_, this->sleep_);
	try {
		std::string body = executor.execute(operation, this->retryPolicy_, cancel);
		this->record(executor.attempts());
		spdlog::debug("Delivered to '{}' after {} attempt(s)", endpoint.name, executor.attempts().size());
		return body;
	} catch (const RetryError& e) {
		this->record(e.attempts());
		throw;
	}
}

std::string WebhookNotifier::notify(const std::string& target, nlohmann::json payload, CancellationToken* cancel) {
	if (!this->settings_)
		throw ConfigError("WebhookNotifier: no settings to resolve target '" + target + "'");
	return this->notify(this->settings_->target(target), std::move(payload), cancel);
}

std::vector<Attempt> WebhookNotifier::lastAttempts() const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	return this->lastAttempts_;
}

RetryStatistics WebhookNotifier::lastStatistics() const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	return RetryStatistics::from(this->lastAttempts_);
}

} // namespace http_notifier
