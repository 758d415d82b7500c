#include "Transport.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <utility>

namespace http_notifier {

namespace {

void ensure_curl_global_init() {
	static std::once_flag inited;

	std::call_once(inited, []() {
		auto rc = curl_global_init(CURL_GLOBAL_DEFAULT);
		if (rc != CURLE_OK) throw std::runtime_error("curl_global_init failed");
		std::atexit([]{ curl_global_cleanup(); });
	});
}

} // namespace

// TransportSettings implementation
const TransportSettings& TransportSettings::getDefault() {
	static TransportSettings defaultSettings;
	return defaultSettings;
}

void TransportSettings::applyCurlEasySettings(CURL* handle) const {
	curl_easy_setopt(handle, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_NONE);
	curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 1L);
	curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(handle, CURLOPT_TCP_KEEPALIVE, 1L);
	curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, this->followLocation ? 1L : 0L);
	curl_easy_setopt(handle, CURLOPT_MAXCONNECTS, this->maxConnections);
	curl_easy_setopt(handle, CURLOPT_USE_SSL, CURLUSESSL_TRY);
	if (!this->userAgent.empty())
		curl_easy_setopt(handle, CURLOPT_USERAGENT, this->userAgent.c_str());
}

// HttpTransfer implementation
HttpTransfer::HttpTransfer(HttpRequest request, RequestPolicy policy, const TransportSettings& settings) :
	request(std::move(request)), policy(std::move(policy)), settings_(settings) {
	ensure_curl_global_init();

	this->curlEasy = curl_easy_init();
	if (!this->curlEasy) throw std::runtime_error("curl_easy_init failed");
	this->setup();
}

HttpTransfer::~HttpTransfer() {
	curl_easy_cleanup(this->curlEasy);
	curl_slist_free_all(this->headers_);
}

const HttpResponse& HttpTransfer::getResponse() const {
	return this->response;
}

HttpResponse HttpTransfer::detachResponse() {
	return std::move(this->response);
}

void HttpTransfer::finalize_transfer() {
	curl_easy_getinfo(this->curlEasy, CURLINFO_RESPONSE_CODE, &this->response.status);

	curl_off_t total = 0;
	curl_easy_getinfo(this->curlEasy, CURLINFO_TOTAL_TIME_T, &total);

	constexpr float us2s = 1e-6f;
	this->response.total = total * us2s;
	this->response.completeAt = util::current_time();
}

void HttpTransfer::perform_blocking() {
	CURLcode rc = curl_easy_perform(this->curlEasy);
	this->finalize_transfer();
	if (rc != CURLE_OK) {
		this->response.status = 0;
		this->response.error = curl_easy_strerror(rc);
	}
}

void HttpTransfer::setup() {
	this->settings_.applyCurlEasySettings(this->curlEasy);

	curl_easy_setopt(this->curlEasy, CURLOPT_URL, this->request.url.c_str());
	if (this->policy.timeout > 0)
		curl_easy_setopt(this->curlEasy, CURLOPT_TIMEOUT_MS, static_cast<long>(this->policy.timeout * 1000));
	if (this->policy.connTimeout > 0)
		curl_easy_setopt(this->curlEasy, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(this->policy.connTimeout * 1000));
	if (this->policy.lowSpeedLimit && this->policy.lowSpeedTime) {
		curl_easy_setopt(this->curlEasy, CURLOPT_LOW_SPEED_TIME, static_cast<long>(this->policy.lowSpeedTime));
		curl_easy_setopt(this->curlEasy, CURLOPT_LOW_SPEED_LIMIT, static_cast<long>(this->policy.lowSpeedLimit));
	}

	for (const auto& header : this->request.headers) {
		this->headers_ = curl_slist_append(this->headers_, header.c_str());
	}
	curl_easy_setopt(this->curlEasy, CURLOPT_HTTPHEADER, this->headers_);

	curl_easy_setopt(this->curlEasy, CURLOPT_POST, 1L);
	curl_easy_setopt(this->curlEasy, CURLOPT_POSTFIELDS, this->request.body.c_str());
	curl_easy_setopt(this->curlEasy, CURLOPT_POSTFIELDSIZE, static_cast<long>(this->request.body.size()));

	curl_easy_setopt(this->curlEasy, CURLOPT_WRITEFUNCTION, HttpTransfer::body_cb);
	curl_easy_setopt(this->curlEasy, CURLOPT_WRITEDATA, this);
	curl_easy_setopt(this->curlEasy, CURLOPT_HEADERFUNCTION, HttpTransfer::header_cb);
	curl_easy_setopt(this->curlEasy, CURLOPT_HEADERDATA, this);
}

size_t HttpTransfer::body_cb(void* ptr, size_t size, size_t nmemb, void* data) {
	HttpTransfer* transfer = static_cast<HttpTransfer*>(data);
	if (transfer->contentLength > transfer->response.body.capacity())
		transfer->response.body.reserve(transfer->contentLength);

	transfer->response.body.append(static_cast<char*>(ptr), size * nmemb);
	return size * nmemb;
}

size_t HttpTransfer::header_cb(void* ptr, size_t size, size_t nmemb, void* data) {
	HttpTransfer* transfer = static_cast<HttpTransfer*>(data);

	const size_t len = size * nmemb;
	if (!ptr || len == 0)
		return len;

	std::string_view sv(static_cast<const char*>(ptr), len);

	if (!sv.empty() && sv.back() == '\n')
		sv.remove_suffix(1);
	if (!sv.empty() && sv.back() == '\r')
		sv.remove_suffix(1);

	if (sv.empty())
		return len;
	// A status line starts a new header block (redirects, 100-continue)
	if (sv.rfind("HTTP/", 0) == 0) {
		transfer->response.headers.clear();
		return len;
	}

	transfer->response.headers.emplace_back(sv);

	// Parse content-length for pre-allocation
	static const std::regex contentLengthRegex("^content-length:\\s*(\\d+)", std::regex::icase);
	std::match_results<std::string_view::const_iterator> match;
	if (std::regex_search(sv.begin(), sv.end(), match, contentLengthRegex)) {
		transfer->contentLength = std::strtoul(match[1].str().c_str(), nullptr, 10);
	}

	return len;
}

// CurlTransport implementation
CurlTransport::CurlTransport(TransportSettings settings) : settings_(std::move(settings)) {}

HttpResponse CurlTransport::send(const HttpRequest& request, const RequestPolicy& policy) {
	HttpTransfer transfer(request, policy, this->settings_);
	transfer.perform_blocking();
	return transfer.detachResponse();
}

} // namespace http_notifier
