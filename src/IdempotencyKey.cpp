#include "IdempotencyKey.hpp"

#include <stdexcept>

extern "C" {
#include <openssl/evp.h>
}

namespace http_notifier {

std::string sha256Hex(std::string_view data) {
	unsigned char md[EVP_MAX_MD_SIZE];
	unsigned int len = 0;
	if (EVP_Digest(data.data(), data.size(), md, &len, EVP_sha256(), nullptr) != 1)
		throw std::runtime_error("EVP_Digest(sha256) failed");

	static const char hex_chars[] = "0123456789abcdef";
	std::string hex;
	hex.reserve(len * 2);
	for (unsigned int i = 0; i < len; ++i) {
		hex += hex_chars[(md[i] >> 4) & 0x0F];
		hex += hex_chars[md[i] & 0x0F];
	}
	return hex;
}

std::string idempotencyKey(std::string_view url, std::string_view body) {
	// NUL separator keeps ("ab", "c") and ("a", "bc") apart
	std::string material;
	material.reserve(url.size() + 1 + body.size());
	material.append(url).push_back('\0');
	material.append(body);
	return sha256Hex(material);
}

} // namespace http_notifier
