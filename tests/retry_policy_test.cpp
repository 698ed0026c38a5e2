#include <catch2/catch_test_macros.hpp>

#include "supex/transport/backoff_policy.hpp"
#include "supex/transport/retry_policy.hpp"

#include <chrono>

using namespace supex;

using Category = TransportError::Category;

// ═══════════════════════════════════════════════════════════════════════════
// RetryPolicy
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("RetryPolicy default configuration", "[retry][policy]") {
    RetryPolicy policy;

    SECTION("Two retries, three attempts") {
        REQUIRE(policy.max_retries() == 2);
        REQUIRE(policy.max_attempts() == 3);
    }

    SECTION("Transport failures are retryable") {
        REQUIRE(policy.should_retry(Category::Network, 0) == true);
        REQUIRE(policy.should_retry(Category::Timeout, 0) == true);
        REQUIRE(policy.should_retry(Category::Protocol, 0) == true);
    }

    SECTION("Malformed JSON is never retried") {
        REQUIRE(policy.is_retryable(Category::Parse) == false);
        REQUIRE(policy.should_retry(Category::Parse, 0) == false);
    }
}

TEST_CASE("RetryPolicy respects the retry budget", "[retry][policy]") {
    RetryPolicy policy;
    policy.with_max_retries(2);

    REQUIRE(policy.should_retry(Category::Network, 0) == true);
    REQUIRE(policy.should_retry(Category::Network, 1) == true);
    REQUIRE(policy.should_retry(Category::Network, 2) == false);
    REQUIRE(policy.should_retry(Category::Network, 3) == false);
}

TEST_CASE("RetryPolicy with zero retries never retries", "[retry][policy]") {
    RetryPolicy policy(0);

    REQUIRE(policy.max_attempts() == 1);
    REQUIRE(policy.should_retry(Category::Network, 0) == false);
    REQUIRE(policy.is_retryable(Category::Network) == true);
}

TEST_CASE("RetryPolicy categories can be disabled", "[retry][policy]") {
    RetryPolicy policy;
    policy.with_retry_on_timeout(false).with_retry_on_protocol_error(false);

    REQUIRE(policy.should_retry(Category::Network, 0) == true);
    REQUIRE(policy.should_retry(Category::Timeout, 0) == false);
    REQUIRE(policy.should_retry(Category::Protocol, 0) == false);

    policy.with_retry_on_network_error(false);
    REQUIRE(policy.should_retry(Category::Network, 0) == false);
}

// ═══════════════════════════════════════════════════════════════════════════
// Backoff
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("NoBackoff and ConstantBackoff", "[retry][backoff]") {
    NoBackoff none;
    REQUIRE(none.next_delay(0).count() == 0);
    REQUIRE(none.next_delay(5).count() == 0);

    ConstantBackoff constant(std::chrono::milliseconds{250});
    REQUIRE(constant.next_delay(0).count() == 250);
    REQUIRE(constant.next_delay(7).count() == 250);
}

TEST_CASE("ExponentialBackoff grows and caps", "[retry][backoff]") {
    ExponentialBackoff backoff(
        std::chrono::milliseconds{100},
        2.0,
        std::chrono::milliseconds{1000},
        0.0  // no jitter
    );

    REQUIRE(backoff.next_delay(0).count() == 100);
    REQUIRE(backoff.next_delay(1).count() == 200);
    REQUIRE(backoff.next_delay(2).count() == 400);
    REQUIRE(backoff.next_delay(3).count() == 800);
    REQUIRE(backoff.next_delay(4).count() == 1000);
    REQUIRE(backoff.next_delay(20).count() == 1000);
}

TEST_CASE("ExponentialBackoff jitter stays within bounds", "[retry][backoff]") {
    ExponentialBackoff backoff(
        std::chrono::milliseconds{1000},
        2.0,
        std::chrono::milliseconds{10000},
        0.25
    );

    for (int i = 0; i < 50; ++i) {
        const auto delay = backoff.next_delay(0).count();
        REQUIRE(delay >= 750);
        REQUIRE(delay <= 1250);
    }
}
