#include <catch2/catch_test_macros.hpp>
#include "db/generic_connection_pool.hpp"
#include "db/pooled_connection.hpp"
#include "mocks/mock_backend.hpp"
#include <thread>

using namespace sqlgate;
using namespace sqlgate::testing;

namespace {

struct PoolFixture {
    std::shared_ptr<MockDatabase> db = std::make_shared<MockDatabase>();
    std::shared_ptr<MockConnectionFactory> factory = std::make_shared<MockConnectionFactory>(db);
};

} // namespace

TEST_CASE("Pool: pre-warms min_connections", "[pool]") {
    PoolFixture f;
    PoolConfig config;
    config.min_connections = 2;
    config.max_connections = 4;

    GenericConnectionPool pool("pool-test", config, f.factory);

    const auto stats = pool.get_stats();
    CHECK(stats.total_connections == 2);
    CHECK(stats.idle_connections == 2);
    CHECK(f.db->connects == 2);
}

TEST_CASE("Pool: connection within lifetime is reused", "[pool][lifetime]") {
    PoolFixture f;
    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 2;
    config.max_lifetime = std::chrono::seconds(60);

    GenericConnectionPool pool("pool-test", config, f.factory);

    for (int i = 0; i < 3; ++i) {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }

    const auto stats = pool.get_stats();
    CHECK(stats.connections_recycled == 0);
    CHECK(f.db->connects == 1);
}

TEST_CASE("Pool: short max_lifetime causes connection recycling", "[pool][lifetime]") {
    PoolFixture f;
    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 2;
    config.max_lifetime = std::chrono::milliseconds(100);

    GenericConnectionPool pool("pool-test", config, f.factory);

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(250));

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }

    CHECK(pool.get_stats().connections_recycled >= 1);
    CHECK(f.db->connects >= 2);
}

TEST_CASE("Pool: max_lifetime=0 disables recycling", "[pool][lifetime]") {
    PoolFixture f;
    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 2;
    config.max_lifetime = std::chrono::milliseconds(0);

    GenericConnectionPool pool("pool-test", config, f.factory);

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }

    CHECK(pool.get_stats().connections_recycled == 0);
    CHECK(f.db->connects == 1);
}

TEST_CASE("Pool: acquire times out when every slot is checked out", "[pool]") {
    PoolFixture f;
    PoolConfig config;
    config.min_connections = 0;
    config.max_connections = 1;

    GenericConnectionPool pool("pool-test", config, f.factory);

    auto held = pool.acquire(std::chrono::milliseconds(100));
    REQUIRE(held != nullptr);

    auto second = pool.acquire(std::chrono::milliseconds(50));
    CHECK(second == nullptr);
    CHECK(pool.last_error().find("Timed out") != std::string::npos);
    CHECK(pool.get_stats().failed_acquires == 1);
}

TEST_CASE("Pool: factory failure is reported through last_error", "[pool]") {
    PoolFixture f;
    f.db->reachable = false;
    f.db->connect_error = "Access denied for user 'app'";

    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 2;

    GenericConnectionPool pool("pool-test", config, f.factory);
    CHECK(pool.get_stats().total_connections == 0);
    CHECK(pool.last_error() == "Access denied for user 'app'");

    auto conn = pool.acquire(std::chrono::milliseconds(50));
    CHECK(conn == nullptr);
    CHECK(pool.last_error() == "Access denied for user 'app'");
}

TEST_CASE("Pool: broken connection is closed instead of reused", "[pool]") {
    PoolFixture f;
    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 2;

    GenericConnectionPool pool("pool-test", config, f.factory);
    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
        conn->mark_broken();
    }
    CHECK(pool.get_stats().total_connections == 0);

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }
    CHECK(f.db->connects == 2);
}

TEST_CASE("Pool: idle connection past idle_timeout is health-checked", "[pool][idle]") {
    PoolFixture f;
    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 2;
    config.idle_timeout = std::chrono::milliseconds(50);

    GenericConnectionPool pool("pool-test", config, f.factory);
    std::this_thread::sleep_for(std::chrono::milliseconds(120));

    f.db->healthy = false;
    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }

    CHECK(f.db->health_checks >= 1);
    CHECK(pool.get_stats().health_check_failures == 1);
    CHECK(f.db->connects == 2);
}

TEST_CASE("Pool: drain closes idle connections and refuses new acquires", "[pool][drain]") {
    PoolFixture f;
    PoolConfig config;
    config.min_connections = 2;
    config.max_connections = 3;

    GenericConnectionPool pool("pool-test", config, f.factory);
    auto held = pool.acquire();
    REQUIRE(held != nullptr);

    pool.drain();
    CHECK(pool.is_drained());
    CHECK(pool.get_stats().idle_connections == 0);

    CHECK(pool.acquire(std::chrono::milliseconds(10)) == nullptr);
    CHECK(pool.last_error() == "Connection pool is closed");

    // A connection returned after drain is closed, not parked
    held.reset();
    CHECK(pool.get_stats().total_connections == 0);

    pool.drain();  // idempotent
    CHECK(pool.is_drained());
}

TEST_CASE("Pool: housekeep retires idle connections above the floor", "[pool][idle][housekeeping]") {
    PoolFixture f;
    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 3;
    config.idle_timeout = std::chrono::milliseconds(50);

    GenericConnectionPool pool("pool-test", config, f.factory);
    {
        auto a = pool.acquire();
        auto b = pool.acquire();
        REQUIRE(a != nullptr);
        REQUIRE(b != nullptr);
    }
    CHECK(pool.get_stats().total_connections == 2);

    std::this_thread::sleep_for(std::chrono::milliseconds(120));

    CHECK(pool.housekeep() == 1);
    const auto stats = pool.get_stats();
    CHECK(stats.total_connections == 1);
    CHECK(stats.idle_connections == 1);
    CHECK(stats.idle_evictions == 1);
    CHECK(f.db->closes == 1);

    // The floor itself is never retired for idleness
    CHECK(pool.housekeep() == 0);
    CHECK(pool.get_stats().total_connections == 1);
}

TEST_CASE("Pool: housekeep replaces idle connections past max_lifetime", "[pool][lifetime][housekeeping]") {
    PoolFixture f;
    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 2;
    config.max_lifetime = std::chrono::milliseconds(50);

    GenericConnectionPool pool("pool-test", config, f.factory);
    CHECK(f.db->connects == 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(120));

    CHECK(pool.housekeep() == 1);
    const auto stats = pool.get_stats();
    CHECK(stats.connections_recycled == 1);
    CHECK(stats.total_connections == 1);
    CHECK(f.db->connects == 2);
}

TEST_CASE("Pool: housekeep leaves checked-out connections alone", "[pool][housekeeping]") {
    PoolFixture f;
    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 2;
    config.max_lifetime = std::chrono::milliseconds(50);

    GenericConnectionPool pool("pool-test", config, f.factory);
    auto held = pool.acquire();
    REQUIRE(held != nullptr);

    std::this_thread::sleep_for(std::chrono::milliseconds(120));

    CHECK(pool.housekeep() == 0);
    CHECK(held->get()->is_connected());
    CHECK(f.db->connects == 1);
}

TEST_CASE("Pool: housekeep refills the floor after a failed pre-warm", "[pool][housekeeping]") {
    PoolFixture f;
    f.db->reachable = false;
    PoolConfig config;
    config.min_connections = 2;
    config.max_connections = 3;

    GenericConnectionPool pool("pool-test", config, f.factory);
    CHECK(pool.get_stats().total_connections == 0);

    f.db->reachable = true;
    CHECK(pool.housekeep() == 0);
    CHECK(pool.get_stats().total_connections == 2);
    CHECK(pool.get_stats().idle_connections == 2);
}

TEST_CASE("Pool: housekeep does nothing once drained", "[pool][drain][housekeeping]") {
    PoolFixture f;
    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 2;

    GenericConnectionPool pool("pool-test", config, f.factory);
    pool.drain();

    CHECK(pool.housekeep() == 0);
    CHECK(pool.get_stats().total_connections == 0);
    CHECK(f.db->connects == 1);
}
