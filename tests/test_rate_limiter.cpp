#include <catch2/catch_test_macros.hpp>
#include "server/rate_limiter.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace sqlgate;
using namespace std::chrono_literals;

namespace {

RateLimitConfig limit_config(uint32_t max_requests, std::chrono::milliseconds window) {
    RateLimitConfig cfg;
    cfg.enabled = true;
    cfg.max_requests = max_requests;
    cfg.window = window;
    cfg.idle_eviction = 0s;   // no background sweeper in unit tests
    return cfg;
}

} // namespace

TEST_CASE("FixedWindowRateLimiter: admits up to the limit", "[rate_limiter]") {
    FixedWindowRateLimiter limiter(limit_config(3, 1000ms));
    const auto t0 = FixedWindowRateLimiter::Clock::now();

    for (uint32_t i = 1; i <= 3; ++i) {
        const auto r = limiter.check_at("alice", t0);
        REQUIRE(r.allowed);
        CHECK(r.count == i);
        CHECK(r.limit == 3);
        CHECK_FALSE(r.blocked_until.has_value());
    }

    SECTION("Next request in the window is denied until the window ends") {
        const auto denied = limiter.check_at("alice", t0 + 250ms);
        CHECK_FALSE(denied.allowed);
        CHECK(denied.count == 3);
        CHECK(denied.retry_after == 750ms);
        REQUIRE(denied.blocked_until.has_value());

        const auto still = limiter.check_at("alice", t0 + 999ms);
        CHECK_FALSE(still.allowed);
        CHECK(still.retry_after == 1ms);
    }

    SECTION("A new window starts fresh") {
        REQUIRE_FALSE(limiter.check_at("alice", t0 + 500ms).allowed);
        const auto r = limiter.check_at("alice", t0 + 1000ms);
        CHECK(r.allowed);
        CHECK(r.count == 1);
    }

    SECTION("Other clients have their own window") {
        CHECK(limiter.check_at("bob", t0).allowed);
        CHECK_FALSE(limiter.check_at("alice", t0).allowed);
    }

    SECTION("Denials are counted") {
        (void)limiter.check_at("alice", t0);
        (void)limiter.check_at("alice", t0);
        const auto stats = limiter.get_stats();
        CHECK(stats.total_checks == 5);
        CHECK(stats.total_denied == 2);
        CHECK(stats.client_count == 1);
    }
}

TEST_CASE("FixedWindowRateLimiter: try_acquire", "[rate_limiter]") {
    FixedWindowRateLimiter limiter(limit_config(2, 60000ms));
    CHECK(limiter.try_acquire("carol"));
    CHECK(limiter.try_acquire("carol"));
    CHECK_FALSE(limiter.try_acquire("carol"));
    CHECK(limiter.try_acquire("dave"));
}

TEST_CASE("FixedWindowRateLimiter: disabled", "[rate_limiter]") {
    auto cfg = limit_config(1, 1000ms);
    cfg.enabled = false;
    FixedWindowRateLimiter limiter(cfg);

    for (int i = 0; i < 10; ++i) {
        CHECK(limiter.check("alice").allowed);
    }
    CHECK(limiter.get_stats().total_denied == 0);
    CHECK_FALSE(limiter.client_status("alice").known);
}

TEST_CASE("FixedWindowRateLimiter: client_status", "[rate_limiter]") {
    FixedWindowRateLimiter limiter(limit_config(2, 60000ms));

    SECTION("Unknown client") {
        const auto s = limiter.client_status("nobody");
        CHECK_FALSE(s.known);
        CHECK(s.count == 0);
        CHECK(s.limit == 2);
        CHECK_FALSE(s.blocked_until.has_value());
    }

    SECTION("Does not consume quota") {
        REQUIRE(limiter.check("alice").allowed);
        for (int i = 0; i < 5; ++i) {
            const auto s = limiter.client_status("alice");
            CHECK(s.known);
            CHECK(s.count == 1);
        }
        CHECK(limiter.check("alice").allowed);
    }

    SECTION("Blocked client") {
        REQUIRE(limiter.check("alice").allowed);
        REQUIRE(limiter.check("alice").allowed);
        REQUIRE_FALSE(limiter.check("alice").allowed);

        const auto s = limiter.client_status("alice");
        CHECK(s.known);
        CHECK(s.count == 2);
        CHECK(s.window_remaining > 0ms);
        CHECK(s.window_remaining <= 60000ms);
        REQUIRE(s.blocked_until.has_value());
        CHECK(*s.blocked_until > std::chrono::system_clock::now());
    }
}

TEST_CASE("FixedWindowRateLimiter: idle eviction and reset", "[rate_limiter]") {
    FixedWindowRateLimiter limiter(limit_config(5, 1000ms));
    const auto now = FixedWindowRateLimiter::Clock::now();

    (void)limiter.check_at("stale", now - 30s);
    (void)limiter.check_at("fresh", now);

    CHECK(limiter.cleanup_idle(10s) == 1);
    CHECK_FALSE(limiter.client_status("stale").known);
    CHECK(limiter.client_status("fresh").known);

    const auto stats = limiter.get_stats();
    CHECK(stats.clients_evicted == 1);
    CHECK(stats.client_count == 1);

    limiter.reset_all();
    CHECK(limiter.get_stats().client_count == 0);
}

TEST_CASE("FixedWindowRateLimiter: eviction keeps an open window", "[rate_limiter]") {
    FixedWindowRateLimiter limiter(limit_config(3, 60000ms));
    const auto t0 = FixedWindowRateLimiter::Clock::now() - 2s;

    for (int i = 0; i < 3; ++i) {
        REQUIRE(limiter.check_at("alice", t0).allowed);
    }
    REQUIRE_FALSE(limiter.check_at("alice", t0).allowed);

    // Quiet for longer than the eviction period, but still inside the window
    CHECK(limiter.cleanup_idle(1s) == 0);
    CHECK(limiter.client_status("alice").known);

    int admitted = 0;
    for (int i = 0; i < 3; ++i) {
        if (limiter.check("alice").allowed) ++admitted;
    }
    CHECK(admitted == 0);
    CHECK(limiter.get_stats().clients_evicted == 0);
}

TEST_CASE("FixedWindowRateLimiter: eviction after the window ends", "[rate_limiter]") {
    FixedWindowRateLimiter limiter(limit_config(3, 1000ms));
    const auto t0 = FixedWindowRateLimiter::Clock::now() - 5s;

    for (int i = 0; i < 4; ++i) {
        (void)limiter.check_at("alice", t0);
    }

    CHECK(limiter.cleanup_idle(1s) == 1);
    CHECK_FALSE(limiter.client_status("alice").known);

    const auto r = limiter.check("alice");
    CHECK(r.allowed);
    CHECK(r.count == 1);
}

TEST_CASE("FixedWindowRateLimiter: concurrent requests never overshoot", "[rate_limiter]") {
    FixedWindowRateLimiter limiter(limit_config(100, 60000ms));

    std::atomic<int> allowed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                if (limiter.check("shared").allowed) {
                    allowed.fetch_add(1);
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(allowed.load() == 100);
    CHECK(limiter.get_stats().total_denied == 300);
}
