#pragma once

#include <string>
#include <string_view>

namespace http_notifier {

// Lowercase hex SHA-256 of `data`
std::string sha256Hex(std::string_view data);

/**
 * Idempotency key for one logical delivery: hex SHA-256 of the target URL and the
 * serialized body. Every attempt of the same call carries the same key.
 */
std::string idempotencyKey(std::string_view url, std::string_view body);

} // namespace http_notifier
