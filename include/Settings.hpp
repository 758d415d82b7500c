#pragma once

#include "RetryStrategies.hpp"
#include "models.hpp"

#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace http_notifier {

struct Endpoint {
	std::string name;
	std::string url;
	std::string channel;	// empty means leave the payload's channel alone
};

/**
 * Process-wide notifier configuration.
 * Loaded once before any delivery starts and only read afterwards.
 */
struct Settings {
	std::map<std::string, Endpoint> targets;
	RetryPolicy retryPolicy;
	RequestPolicy requestPolicy;
	bool idempotencyKey = true;

	// Throws ConfigError for unknown names
	const Endpoint& target(const std::string& name) const;

	static Settings fromJson(const nlohmann::json& doc);
	static Settings load(const std::string& path);
};

// "wait" section of the config, e.g. {"type": "chain", "delays": [1, 1, 3, 3, 6]}
BackoffFn parseBackoff(const nlohmann::json& wait);

} // namespace http_notifier
