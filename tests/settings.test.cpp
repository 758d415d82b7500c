#include <catch2/catch.hpp>
#include "Errors.hpp"
#include "Settings.hpp"

#include <cstdio>
#include <string>
#include <fstream>

using namespace http_notifier;

TEST_CASE("Targets accept a URL string or an object", "[settings]") {
    auto settings = Settings::fromJson(nlohmann::json::parse(R"({
        "targets": {
            "webhook": { "url": "https://hooks.example/T0", "channel": "learning" },
            "mock5xx": "https://mock.example/500"
        }
    })"));

    REQUIRE(settings.targets.size() == 2);
    REQUIRE(settings.target("webhook").url == "https://hooks.example/T0");
    REQUIRE(settings.target("webhook").channel == "learning");
    REQUIRE(settings.target("mock5xx").url == "https://mock.example/500");
    REQUIRE(settings.target("mock5xx").channel.empty());
    REQUIRE(settings.target("mock5xx").name == "mock5xx");

    // Defaults
    REQUIRE(settings.retryPolicy.maxAttempts == 4);
    REQUIRE(settings.retryPolicy.wait(3, std::nullopt) == 4.0);
    REQUIRE(settings.idempotencyKey);
}

TEST_CASE("Retry and request sections are applied", "[settings]") {
    auto settings = Settings::fromJson(nlohmann::json::parse(R"({
        "targets": { "a": "https://a.example" },
        "retry": {
            "max_attempts": 6,
            "total_timeout": 30,
            "wait": { "type": "chain", "delays": [1, 1, 3, 3, 6] }
        },
        "request": { "timeout": 10, "connect_timeout": 2.5 }
    })"));

    REQUIRE(settings.retryPolicy.maxAttempts == 6);
    REQUIRE(settings.retryPolicy.totalTimeout == 30.0f);
    REQUIRE(settings.retryPolicy.wait(5, std::nullopt) == 6.0);
    REQUIRE(settings.retryPolicy.wait(1, 9.0) == 9.0);
    REQUIRE(settings.requestPolicy.timeout == 10.0f);
    REQUIRE(settings.requestPolicy.connTimeout == 2.5f);
}

TEST_CASE("parseBackoff understands every wait type", "[settings]") {
    using nlohmann::json;
    REQUIRE(parseBackoff(json{{"type", "exponential"}, {"multiplier", 1}, {"min", 4}, {"max", 10}})(1) == 4.0);
    REQUIRE(parseBackoff(json{{"type", "fixed"}, {"delay", 2}})(3) == 2.0);
    REQUIRE(parseBackoff(json{{"type", "linear"}, {"initial", 1}, {"increment", 2}, {"max", 4}})(2) == 3.0);
    REQUIRE(parseBackoff(json{{"type", "immediate"}})(2) == 0.0);
    REQUIRE_THROWS_AS(parseBackoff(json{{"type", "random"}}), ConfigError);
    REQUIRE_THROWS_AS(parseBackoff(json{{"type", "chain"}}), ConfigError);
    REQUIRE_THROWS_AS(parseBackoff(json::array()), ConfigError);
}

TEST_CASE("Malformed configuration raises ConfigError", "[settings]") {
    using nlohmann::json;
    REQUIRE_THROWS_AS(Settings::fromJson(json::array()), ConfigError);
    REQUIRE_THROWS_AS(Settings::fromJson(json::parse(R"({})")), ConfigError);
    REQUIRE_THROWS_AS(Settings::fromJson(json::parse(R"({"targets": {"a": 5}})")), ConfigError);
    REQUIRE_THROWS_AS(Settings::fromJson(json::parse(R"({"targets": {"a": {"channel": "x"}}})")), ConfigError);
    REQUIRE_THROWS_AS(Settings::fromJson(json::parse(R"({"targets": {"a": "u"}, "retry": {"max_attempts": 0}})")),
                      ConfigError);
    REQUIRE_THROWS_AS(Settings::fromJson(json::parse(R"({"targets": {"a": "u"}, "retry": {"max_attempts": "x"}})")),
                      ConfigError);

    auto settings = Settings::fromJson(json::parse(R"({"targets": {"a": "u"}})"));
    REQUIRE_THROWS_AS(settings.target("b"), ConfigError);
}

TEST_CASE("max_attempts must be an integer that fits the attempt counter", "[settings]") {
    using nlohmann::json;
    auto withAttempts = [](const std::string& value) {
        return json::parse(R"({"targets": {"a": "u"}, "retry": {"max_attempts": )" + value + "}}");
    };

    for (const char* bad : {"-1", "0", "1e12", "2.5", "5000000000", "18446744073709551615", "true", "[3]"})
        REQUIRE_THROWS_AS(Settings::fromJson(withAttempts(bad)), ConfigError);

    REQUIRE(Settings::fromJson(withAttempts("1")).retryPolicy.maxAttempts == 1);
    REQUIRE(Settings::fromJson(withAttempts("4294967295")).retryPolicy.maxAttempts == 4294967295u);
    REQUIRE(Settings::fromJson(json{{"targets", {{"a", "u"}}}, {"retry", {{"max_attempts", 7}}}})
                .retryPolicy.maxAttempts == 7);
}

TEST_CASE("max_server_delay bounds Retry-After overrides", "[settings]") {
    using nlohmann::json;
    auto settings = Settings::fromJson(json::parse(R"({
        "targets": {"a": "u"},
        "retry": {"max_server_delay": 60}
    })"));
    REQUIRE(settings.retryPolicy.wait(1, 1e10) == 60.0);
    REQUIRE(settings.retryPolicy.wait(1, 30.0) == 30.0);
    REQUIRE(settings.retryPolicy.wait(2, std::nullopt) == 2.0);

    auto defaults = Settings::fromJson(json::parse(R"({"targets": {"a": "u"}, "retry": {}})"));
    REQUIRE(defaults.retryPolicy.wait(1, 1e10) == MAX_SERVER_DELAY);

    REQUIRE_THROWS_AS(Settings::fromJson(json::parse(R"({"targets": {"a": "u"}, "retry": {"max_server_delay": -1}})")),
                      ConfigError);
}

TEST_CASE("load reads a file and reports bad files", "[settings]") {
    const std::string path = "http_notifier_settings_test.json";
    {
        std::ofstream out(path);
        out << R"({"targets": {"hook": {"url": "https://hooks.example", "channel": "ops"}}})";
    }
    auto settings = Settings::load(path);
    REQUIRE(settings.target("hook").channel == "ops");

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    REQUIRE_THROWS_AS(Settings::load(path), ConfigError);
    std::remove(path.c_str());

    REQUIRE_THROWS_AS(Settings::load("/nonexistent/http_notifier.json"), ConfigError);
}
