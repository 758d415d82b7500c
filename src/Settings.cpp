#include "Settings.hpp"
#include "Errors.hpp"
#include "RetryStrategies.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace http_notifier {

namespace {

template <typename T>
T value_or(const nlohmann::json& obj, const char* key, T fallback) {
	auto it = obj.find(key);
	if (it == obj.end() || it->is_null())
		return fallback;
	try {
		return it->get<T>();
	} catch (const nlohmann::json::exception& e) {
		throw ConfigError(fmt::format("config: bad value for '{}': {}", key, e.what()));
	}
}

Endpoint parse_endpoint(const std::string& name, const nlohmann::json& node) {
	Endpoint endpoint;
	endpoint.name = name;

	if (node.is_string()) {
		endpoint.url = node.get<std::string>();
	} else if (node.is_object()) {
		endpoint.url = value_or<std::string>(node, "url", "");
		endpoint.channel = value_or<std::string>(node, "channel", "");
	} else {
		throw ConfigError(fmt::format("config: target '{}' must be a URL or an object", name));
	}

	if (endpoint.url.empty())
		throw ConfigError(fmt::format("config: target '{}' has no url", name));
	return endpoint;
}

uint32_t parse_max_attempts(const nlohmann::json& retryNode) {
	auto it = retryNode.find("max_attempts");
	if (it == retryNode.end() || it->is_null())
		return 4;
	constexpr uint64_t limit = std::numeric_limits<uint32_t>::max();
	if (it->is_number_unsigned()) {
		auto value = it->get<uint64_t>();
		if (value >= 1 && value <= limit)
			return static_cast<uint32_t>(value);
	} else if (it->is_number_integer()) {
		auto value = it->get<int64_t>();
		if (value >= 1 && static_cast<uint64_t>(value) <= limit)
			return static_cast<uint32_t>(value);
	}
	throw ConfigError(fmt::format("config: 'retry.max_attempts' must be an integer in [1, {}], got {}",
								  limit, it->dump()));
}

} // namespace

BackoffFn parseBackoff(const nlohmann::json& wait) {
	if (!wait.is_object())
		throw ConfigError("config: 'retry.wait' must be an object");

	const std::string type = value_or<std::string>(wait, "type", "exponential");

	if (type == "exponential") {
		return retry::exponentialBackoff(value_or<double>(wait, "multiplier", 1.0),
										 value_or<double>(wait, "min", 0.0),
										 value_or<double>(wait, "max", 10.0));
	}
	if (type == "chain") {
		auto delays = value_or<std::vector<double>>(wait, "delays", {});
		if (delays.empty())
			throw ConfigError("config: chain wait needs a non-empty 'delays' list");
		return retry::fixedChain(std::move(delays));
	}
	if (type == "fixed")
		return retry::fixedDelay(value_or<double>(wait, "delay", 1.0));
	if (type == "linear") {
		return retry::linearBackoff(value_or<double>(wait, "initial", 1.0),
									value_or<double>(wait, "increment", 1.0),
									value_or<double>(wait, "max", 10.0));
	}
	if (type == "immediate")
		return retry::immediate();

	throw ConfigError(fmt::format("config: unknown wait type '{}'", type));
}

const Endpoint& Settings::target(const std::string& name) const {
	auto it = this->targets.find(name);
	if (it == this->targets.end())
		throw ConfigError(fmt::format("config: unknown target '{}'", name));
	return it->second;
}

Settings Settings::fromJson(const nlohmann::json& doc) {
	if (!doc.is_object())
		throw ConfigError("config: top level must be an object");

	Settings settings;

	auto targets = doc.find("targets");
	if (targets == doc.end() || !targets->is_object() || targets->empty())
		throw ConfigError("config: 'targets' must be a non-empty object");
	for (const auto& [name, node] : targets->items())
		settings.targets.emplace(name, parse_endpoint(name, node));

	if (auto retryNode = doc.find("retry"); retryNode != doc.end()) {
		if (!retryNode->is_object())
			throw ConfigError("config: 'retry' must be an object");

		settings.retryPolicy.maxAttempts = parse_max_attempts(*retryNode);
		settings.retryPolicy.totalTimeout = value_or<float>(*retryNode, "total_timeout", 0.0f);

		double maxServerDelay = value_or<double>(*retryNode, "max_server_delay", MAX_SERVER_DELAY);
		if (!(maxServerDelay >= 0))
			throw ConfigError("config: 'retry.max_server_delay' must be >= 0");

		BackoffFn backoff = retry::exponentialBackoff();
		if (auto waitNode = retryNode->find("wait"); waitNode != retryNode->end())
			backoff = parseBackoff(*waitNode);
		settings.retryPolicy.wait = retry::serverDirected(std::move(backoff), maxServerDelay);
	}

	if (auto requestNode = doc.find("request"); requestNode != doc.end()) {
		if (!requestNode->is_object())
			throw ConfigError("config: 'request' must be an object");
		settings.requestPolicy.timeout = value_or<float>(*requestNode, "timeout", 0.0f);
		settings.requestPolicy.connTimeout = value_or<float>(*requestNode, "connect_timeout", 0.0f);
	}

	settings.idempotencyKey = value_or<bool>(doc, "idempotency_key", true);
	return settings;
}

Settings Settings::load(const std::string& path) {
	std::ifstream in(path);
	if (!in)
		throw ConfigError(fmt::format("config: cannot open '{}'", path));

	nlohmann::json doc;
	try {
		doc = nlohmann::json::parse(in);
	} catch (const nlohmann::json::parse_error& e) {
		throw ConfigError(fmt::format("config: '{}' is not valid JSON: {}", path, e.what()));
	}

	Settings settings = fromJson(doc);
	spdlog::debug("Loaded {} target(s) from '{}'", settings.targets.size(), path);
	return settings;
}

} // namespace http_notifier
