#pragma once

#include "models.hpp"

#include <memory>
#include <string>

#ifdef __cplusplus
extern "C" {
#endif
#include <curl/curl.h>
#ifdef __cplusplus
}
#endif

namespace http_notifier {

/**
 * The only boundary the retry core talks to.
 * One call is one request on the wire; connection handling stays behind it.
 */
class Transport {
public:
	virtual ~Transport() = default;

	// Never throws for network failures, those come back in HttpResponse::error
	virtual HttpResponse send(const HttpRequest& request, const RequestPolicy& policy) = 0;
};

struct TransportSettings {
	long maxConnections = 8;
	bool followLocation = true;
	std::string userAgent = "http-notifier/1.0";

	static const TransportSettings& getDefault();

	void applyCurlEasySettings(CURL* handle) const;
};

// A single blocking libcurl easy transfer
class HttpTransfer {
public:
	explicit HttpTransfer(HttpRequest request, RequestPolicy policy = RequestPolicy(),
						  const TransportSettings& settings = TransportSettings::getDefault());
	~HttpTransfer();

	// Not copyable, not movable: curl callbacks hold `this`
	HttpTransfer(const HttpTransfer&) = delete;
	HttpTransfer& operator=(const HttpTransfer&) = delete;

	const HttpResponse& getResponse() const;
	HttpResponse detachResponse();
	void perform_blocking();

private:
	CURL* curlEasy = nullptr;
	struct curl_slist* headers_ = nullptr;
	size_t contentLength = 0;

	HttpRequest request;
	HttpResponse response;
	RequestPolicy policy;
	const TransportSettings& settings_;

	void setup();
	void finalize_transfer();

	static size_t body_cb(void* ptr, size_t size, size_t nmemb, void* data);
	static size_t header_cb(void* ptr, size_t size, size_t nmemb, void* data);
};

class CurlTransport : public Transport {
public:
	explicit CurlTransport(TransportSettings settings = TransportSettings::getDefault());

	HttpResponse send(const HttpRequest& request, const RequestPolicy& policy) override;

private:
	TransportSettings settings_;
};

} // namespace http_notifier
