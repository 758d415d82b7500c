#include <catch2/catch.hpp>
#include "RetryStrategies.hpp"

#include <limits>

using namespace http_notifier;

TEST_CASE("exponentialBackoff doubles and respects min and max", "[wait]") {
    auto backoff = retry::exponentialBackoff(1.0, 0.0, 10.0);
    REQUIRE(backoff(1) == 1.0);
    REQUIRE(backoff(2) == 2.0);
    REQUIRE(backoff(3) == 4.0);
    REQUIRE(backoff(4) == 8.0);
    REQUIRE(backoff(5) == 10.0);
    REQUIRE(backoff(60) == 10.0);

    auto floored = retry::exponentialBackoff(1.0, 4.0, 10.0);
    REQUIRE(floored(1) == 4.0);
    REQUIRE(floored(3) == 4.0);
    REQUIRE(floored(4) == 8.0);

    // Large exponents stay capped
    REQUIRE(backoff(5000) == 10.0);
}

TEST_CASE("fixedChain walks the steps and repeats the last one", "[wait]") {
    auto chain = retry::fixedChain({1, 1, 3, 3, 6});
    REQUIRE(chain(1) == 1.0);
    REQUIRE(chain(2) == 1.0);
    REQUIRE(chain(3) == 3.0);
    REQUIRE(chain(4) == 3.0);
    REQUIRE(chain(5) == 6.0);
    REQUIRE(chain(9) == 6.0);

    REQUIRE_THROWS_AS(retry::fixedChain({}), std::invalid_argument);
}

TEST_CASE("fixed, linear and immediate schedules", "[wait]") {
    REQUIRE(retry::fixedDelay(2.5)(7) == 2.5);

    auto linear = retry::linearBackoff(1.0, 0.5, 2.0);
    REQUIRE(linear(1) == 1.0);
    REQUIRE(linear(2) == 1.5);
    REQUIRE(linear(3) == 2.0);
    REQUIRE(linear(10) == 2.0);

    REQUIRE(retry::immediate()(3) == 0.0);
}

TEST_CASE("serverDirected prefers the override and otherwise falls back", "[wait]") {
    auto wait = retry::serverDirected(retry::fixedDelay(1.0));
    REQUIRE(wait(1, 5.0) == 5.0);
    REQUIRE(wait(2, std::nullopt) == 1.0);
    REQUIRE(wait(3, 0.0) == 0.0);
}

TEST_CASE("serverDirected clamps overrides to the configured ceiling", "[wait]") {
    auto wait = retry::serverDirected(retry::fixedDelay(1.0));
    REQUIRE(wait(1, 1e10) == MAX_SERVER_DELAY);
    REQUIRE(wait(1, std::numeric_limits<double>::infinity()) == MAX_SERVER_DELAY);
    REQUIRE(wait(1, -4.0) == 0.0);
    REQUIRE(wait(1, std::numeric_limits<double>::quiet_NaN()) == 1.0);

    auto tight = retry::serverDirected(retry::fixedDelay(1.0), 30.0);
    REQUIRE(tight(1, 120.0) == 30.0);
    REQUIRE(tight(1, 12.0) == 12.0);
}

TEST_CASE("scheduleOnly ignores server hints", "[wait]") {
    auto wait = retry::scheduleOnly(retry::fixedDelay(1.0));
    REQUIRE(wait(1, 5.0) == 1.0);
}

TEST_CASE("withJitter draws from the injected source", "[wait]") {
    std::vector<double> asked;
    auto source = [&](double max) {
        asked.push_back(max);
        return -max;
    };
    auto jittered = retry::withJitter(retry::fixedDelay(2.0), 0.25, source);
    REQUIRE(jittered(1) == 1.5);
    REQUIRE(asked == std::vector<double>{0.5});

    // Never negative
    auto big = retry::withJitter(retry::fixedDelay(1.0), 1.0, [](double) { return -5.0; });
    REQUIRE(big(1) == 0.0);
}

TEST_CASE("Default jitter stays within bounds", "[wait]") {
    auto jittered = retry::withJitter(retry::fixedDelay(2.0), 0.5);
    for (int i = 0; i < 100; ++i) {
        double d = jittered(1);
        REQUIRE(d >= 1.0);
        REQUIRE(d <= 3.0);
    }
}

TEST_CASE("Schedules are deterministic", "[wait]") {
    auto a = retry::serverDirected(retry::exponentialBackoff(0.5, 0.0, 30.0));
    auto b = retry::serverDirected(retry::exponentialBackoff(0.5, 0.0, 30.0));
    for (uint32_t i = 1; i <= 8; ++i)
        REQUIRE(a(i, std::nullopt) == b(i, std::nullopt));
}

TEST_CASE("Predicates combine with anyOf and allOf", "[wait][predicate]") {
    Outcome rateLimited = RetryableFailure{FailureKind::RateLimited, "HTTP 429", 429, std::nullopt};
    Outcome transport = RetryableFailure{FailureKind::TransportError, "down", 0, std::nullopt};
    Outcome rejected = FatalFailure{FailureKind::ClientRejected, "HTTP 404", 404};

    REQUIRE(retry::retryableOutcome()(rateLimited));
    REQUIRE_FALSE(retry::retryableOutcome()(rejected));

    auto statusOnly = retry::httpStatus();
    REQUIRE(statusOnly(rateLimited));
    REQUIRE_FALSE(statusOnly(transport));

    auto either = retry::anyOf(statusOnly, retry::failureKinds({FailureKind::TransportError}));
    REQUIRE(either(rateLimited));
    REQUIRE(either(transport));
    REQUIRE_FALSE(either(rejected));

    auto both = retry::allOf(retry::retryableOutcome(), retry::failureKinds({FailureKind::RateLimited}));
    REQUIRE(both(rateLimited));
    REQUIRE_FALSE(both(transport));
}
