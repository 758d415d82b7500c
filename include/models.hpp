#pragma once

#include <cstdint>
#include <string>
#include <vector>

#ifdef __cplusplus
extern "C" {
#endif
#include <curl/curl.h>
#ifdef __cplusplus
}
#endif

namespace http_notifier {

struct RequestPolicy {
	float timeout = 0;		// optional per-request timeout in seconds (<=0 means wait indefinitely)
	float connTimeout = 0;	// optional connection (DNS + handshake) timeout in seconds (<=0 means default 300 second)

	uint32_t lowSpeedLimit = 0;	// in bytes
	uint32_t lowSpeedTime = 0;	// in seconds
};

// A webhook delivery is always a POST
struct HttpRequest {
	std::string url;
	std::vector<std::string> headers; // e.g. "Content-Type: application/json"
	std::string body;
};

struct HttpResponse {
	long status = 0;

	std::vector<std::string> headers; // raw "Name: value" lines
	std::string body;
	std::string error; // non-empty on transport error, status is 0 then

	float total = 0;		// transfer time in seconds
	double completeAt = 0;	// seconds since epoch
};

} // namespace http_notifier
