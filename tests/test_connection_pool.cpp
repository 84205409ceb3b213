#include <catch2/catch_test_macros.hpp>
#include "db/connection_pool.hpp"
#include "mocks/fake_database.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace sqlgate;
using namespace sqlgate::testing;
using namespace std::chrono_literals;

namespace {

DatabaseConfig pool_config(size_t min_conns, size_t max_conns) {
    DatabaseConfig cfg;
    cfg.connection_string = "host=fake dbname=test";
    cfg.min_connections = min_conns;
    cfg.max_connections = max_conns;
    cfg.checkout_timeout = 1000ms;
    cfg.query_timeout = 2500ms;
    cfg.idle_timeout = 0ms;
    cfg.maintenance_interval = 1h;   // maintenance only on explicit refill requests
    return cfg;
}

// Poll until pred() holds or 2s pass
template<typename Pred>
bool eventually(Pred pred) {
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

TEST_CASE("ConnectionPool: pre-warm and checkout", "[pool]") {
    auto factory = std::make_shared<FakeConnectionFactory>();
    ConnectionPool pool(pool_config(2, 4), factory);

    CHECK(factory->created() == 2);
    CHECK(factory->last_conninfo() == "host=fake dbname=test");
    auto stats = pool.stats();
    CHECK(stats.idle == 2);
    CHECK(stats.in_use == 0);
    CHECK(stats.total == 2);

    SECTION("Checkout reuses a warm connection") {
        auto r = pool.checkout();
        REQUIRE(r.is_ok());
        auto& lease = r.value();
        REQUIRE(lease.is_valid());
        CHECK(factory->created() == 2);

        auto* fake = dynamic_cast<FakeConnection*>(lease.get());
        REQUIRE(fake != nullptr);
        CHECK(fake->query_timeout_ms() == 2500);

        stats = pool.stats();
        CHECK(stats.idle == 1);
        CHECK(stats.in_use == 1);

        lease.release(true);
        CHECK_FALSE(lease.is_valid());
        CHECK(pool.stats().idle == 2);
        CHECK(pool.stats().in_use == 0);
    }

    SECTION("Checkout beyond the warm set opens new connections") {
        std::vector<PooledConnection> leases;
        for (int i = 0; i < 4; ++i) {
            auto r = pool.checkout();
            REQUIRE(r.is_ok());
            leases.push_back(std::move(r.value()));
        }
        CHECK(factory->created() == 4);
        CHECK(pool.stats().peak_in_use == 4);
        for (auto& l : leases) l.release(true);
        CHECK(pool.stats().idle == 4);
    }

    SECTION("Most recently returned connection is reused first") {
        auto a = pool.checkout();
        auto b = pool.checkout();
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        const size_t b_slot = b.value().slot();
        a.value().release(true);
        b.value().release(true);

        auto c = pool.checkout();
        REQUIRE(c.is_ok());
        CHECK(c.value().slot() == b_slot);
        c.value().release(true);
    }
}

TEST_CASE("ConnectionPool: never exceeds max_connections", "[pool]") {
    auto factory = std::make_shared<FakeConnectionFactory>();
    ConnectionPool pool(pool_config(0, 2), factory);

    auto a = pool.checkout();
    auto b = pool.checkout();
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());

    SECTION("Third checkout times out with POOL_EXHAUSTED") {
        const auto start = std::chrono::steady_clock::now();
        auto c = pool.checkout(50ms);
        const auto waited = std::chrono::steady_clock::now() - start;

        REQUIRE(c.is_error());
        CHECK(c.error_category() == ErrorCategory::POOL_EXHAUSTED);
        CHECK(waited >= 50ms);
        CHECK(pool.stats().checkout_timeouts == 1);
        CHECK(factory->created() == 2);
    }

    SECTION("A waiter is woken by a release") {
        std::atomic<bool> got{false};
        std::thread waiter([&] {
            auto c = pool.checkout(2000ms);
            got = c.is_ok();
            if (c.is_ok()) c.value().release(true);
        });
        std::this_thread::sleep_for(50ms);
        CHECK_FALSE(got.load());
        a.value().release(true);
        waiter.join();
        CHECK(got.load());
        CHECK(factory->created() == 2);
    }
}

TEST_CASE("ConnectionPool: concurrent callers share at most max_connections", "[pool]") {
    auto factory = std::make_shared<FakeConnectionFactory>();
    factory->set_latency(10ms);
    ConnectionPool pool(pool_config(1, 3), factory);

    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 12; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 3; ++i) {
                auto r = pool.checkout(5000ms);
                if (r.is_error()) continue;
                auto rs = r.value()->execute("SELECT 1", 10);
                r.value().release(rs.success);
                ok.fetch_add(1);
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(ok.load() == 36);
    CHECK(factory->max_concurrent() <= 3);
    CHECK(factory->created() <= 3);
    CHECK(pool.stats().peak_in_use <= 3);
    CHECK(pool.stats().in_use == 0);
}

TEST_CASE("ConnectionPool: unhealthy connections are discarded", "[pool]") {
    auto factory = std::make_shared<FakeConnectionFactory>();
    ConnectionPool pool(pool_config(0, 2), factory);

    SECTION("Unhealthy checkin closes the session") {
        auto r = pool.checkout();
        REQUIRE(r.is_ok());
        r.value().release(false);
        CHECK(factory->closed() == 1);
        CHECK(pool.stats().total == 0);
        CHECK(pool.stats().idle == 0);
    }

    SECTION("Healthy checkin of a dropped session still closes it") {
        auto r = pool.checkout();
        REQUIRE(r.is_ok());
        dynamic_cast<FakeConnection*>(r.value().get())->drop();
        r.value().release(true);
        CHECK(factory->closed() == 1);
        CHECK(pool.stats().idle == 0);
    }

    SECTION("A lease dropped without release is checked in unhealthy") {
        {
            auto r = pool.checkout();
            REQUIRE(r.is_ok());
        }
        CHECK(factory->closed() == 1);
        CHECK(pool.stats().in_use == 0);
    }

    SECTION("A slot freed by discard is reusable") {
        auto a = pool.checkout();
        auto b = pool.checkout();
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        a.value().release(false);
        auto c = pool.checkout(100ms);
        REQUIRE(c.is_ok());
        CHECK(factory->created() == 3);
    }
}

TEST_CASE("ConnectionPool: refills to min_connections after a discard", "[pool]") {
    auto factory = std::make_shared<FakeConnectionFactory>();
    ConnectionPool pool(pool_config(2, 4), factory);

    auto r = pool.checkout();
    REQUIRE(r.is_ok());
    r.value().release(false);

    CHECK(eventually([&] { return pool.stats().total == 2; }));
    CHECK(factory->created() == 3);
}

TEST_CASE("ConnectionPool: database unavailable", "[pool]") {
    auto factory = std::make_shared<FakeConnectionFactory>();
    factory->set_fail_creates(true);
    ConnectionPool pool(pool_config(1, 1), factory);

    CHECK(pool.stats().total == 0);

    auto r = pool.checkout(50ms);
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::EXECUTION);
    CHECK(r.error_message() == "database unavailable");
    CHECK(pool.stats().create_failures >= 2);

    // The reserved slot went back to the free list
    factory->set_fail_creates(false);
    auto again = pool.checkout(50ms);
    REQUIRE(again.is_ok());
    again.value().release(true);
}

TEST_CASE("ConnectionPool: idle reaping", "[pool]") {
    auto factory = std::make_shared<FakeConnectionFactory>();
    auto cfg = pool_config(0, 2);
    cfg.idle_timeout = 10ms;
    ConnectionPool pool(cfg, factory);

    auto r = pool.checkout();
    REQUIRE(r.is_ok());
    r.value().release(true);
    REQUIRE(pool.stats().idle == 1);

    std::this_thread::sleep_for(30ms);

    SECTION("reap_idle closes expired sessions") {
        CHECK(pool.reap_idle() == 1);
        CHECK(factory->closed() == 1);
        CHECK(pool.stats().idle_reaped == 1);
    }

    SECTION("Checkout replaces an expired session instead of handing it out") {
        auto fresh = pool.checkout();
        REQUIRE(fresh.is_ok());
        CHECK(factory->created() == 2);
        CHECK(factory->closed() == 1);
        fresh.value().release(true);
    }
}

TEST_CASE("ConnectionPool: idle sessions are health-checked before reuse", "[pool]") {
    auto factory = std::make_shared<FakeConnectionFactory>();
    auto cfg = pool_config(0, 1);
    cfg.health_check_after = 0ms;
    cfg.health_check_query = "SELECT 1 AS alive";
    ConnectionPool pool(cfg, factory);

    auto first = pool.checkout();
    REQUIRE(first.is_ok());
    auto* fake = dynamic_cast<FakeConnection*>(first.value().get());
    REQUIRE(fake != nullptr);
    first.value().release(true);
    REQUIRE(pool.stats().idle == 1);
    std::this_thread::sleep_for(2ms);

    SECTION("A live session passes and is reused") {
        auto again = pool.checkout();
        REQUIRE(again.is_ok());
        CHECK(again.value().get() == fake);
        CHECK(factory->health_checks() == 1);
        CHECK(factory->last_health_query() == "SELECT 1 AS alive");
        CHECK(factory->created() == 1);
        again.value().release(true);
    }

    SECTION("A session the server dropped is replaced") {
        fake->drop();
        auto again = pool.checkout();
        REQUIRE(again.is_ok());
        auto* replacement = dynamic_cast<FakeConnection*>(again.value().get());
        REQUIRE(replacement != nullptr);
        CHECK(replacement->id() == 2);
        CHECK(replacement->is_connected());
        CHECK(factory->created() == 2);
        CHECK(factory->closed() == 1);
        CHECK(pool.stats().health_check_failures == 1);
        again.value().release(true);
    }
}

TEST_CASE("ConnectionPool: recently used sessions skip the health check", "[pool]") {
    auto factory = std::make_shared<FakeConnectionFactory>();
    auto cfg = pool_config(1, 1);
    cfg.health_check_after = 1h;
    ConnectionPool pool(cfg, factory);

    for (int i = 0; i < 3; ++i) {
        auto r = pool.checkout();
        REQUIRE(r.is_ok());
        r.value().release(true);
    }
    CHECK(factory->health_checks() == 0);
    CHECK(factory->created() == 1);
}

TEST_CASE("ConnectionPool: shutdown", "[pool]") {
    auto factory = std::make_shared<FakeConnectionFactory>();
    ConnectionPool pool(pool_config(2, 3), factory);

    auto held = pool.checkout();
    REQUIRE(held.is_ok());

    pool.shutdown();
    CHECK(factory->closed() == 1);   // the idle one

    auto r = pool.checkout(10ms);
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::EXECUTION);

    // Outstanding lease is closed on return, even when reported healthy
    held.value().release(true);
    CHECK(factory->closed() == 2);
    CHECK(factory->live() == 0);

    pool.shutdown();   // idempotent
}
