#include <catch2/catch_test_macros.hpp>
#include "registry/connection_registry.hpp"
#include "mocks/mock_backend.hpp"
#include <chrono>
#include <limits>
#include <regex>
#include <set>
#include <thread>

using namespace sqlgate;
using namespace sqlgate::testing;

namespace {

struct RegistryFixture {
    std::shared_ptr<MockDatabase> db = std::make_shared<MockDatabase>();
    std::shared_ptr<MockBackend> backend = std::make_shared<MockBackend>(db);
    std::shared_ptr<ConnectionRegistry> registry = make_registry(backend);
};

// Polls until done() holds or two seconds pass
template <typename Pred>
bool eventually(Pred done) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

bool is_uuid_v4(const std::string& s) {
    static const std::regex re(
        "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    return std::regex_match(s, re);
}

} // namespace

TEST_CASE("Registry: create returns a UUID handle and canonical URL", "[registry]") {
    RegistryFixture f;

    auto created = f.registry->create(make_request("db.local", 3306, "shop"));
    REQUIRE(created.is_ok());
    CHECK(is_uuid_v4(created.value().handle));
    CHECK(created.value().url ==
          "mysql://db.local:3306/shop?useSSL=false&serverTimezone=UTC&characterEncoding=utf8");
    CHECK(f.registry->size() == 1);
}

TEST_CASE("Registry: URL never carries credentials", "[registry]") {
    RegistryFixture f;
    auto request = make_request();
    request.user = "admin";
    request.password = "p@ss:word";

    auto created = f.registry->create(request);
    REQUIRE(created.is_ok());
    CHECK(created.value().url.find("admin") == std::string::npos);
    CHECK(created.value().url.find("p@ss") == std::string::npos);

    // The driver URL does carry them, percent-encoded
    const auto driver_url = f.backend->last_factory->last_connection_string();
    CHECK(driver_url.find("admin:p%40ss%3Aword@db.local:3306/shop") != std::string::npos);
}

TEST_CASE("Registry: caller params replace the defaults", "[registry]") {
    RegistryFixture f;
    auto request = make_request();
    request.params = "useSSL=true";

    auto created = f.registry->create(request);
    REQUIRE(created.is_ok());
    CHECK(created.value().url == "mysql://db.local:3306/shop?useSSL=true");

    auto blank = make_request();
    blank.params = "   ";
    auto defaulted = f.registry->create(blank);
    REQUIRE(defaulted.is_ok());
    CHECK(defaulted.value().url.ends_with("?useSSL=false&serverTimezone=UTC&characterEncoding=utf8"));
}

TEST_CASE("Registry: missing or invalid coordinates are rejected", "[registry][validation]") {
    RegistryFixture f;

    auto request = make_request();
    request.host.reset();
    auto no_host = f.registry->create(request);
    REQUIRE(no_host.is_error());
    CHECK(no_host.error_code() == ErrorCode::INVALID_ARGUMENT);
    CHECK(no_host.error_message() == "host is required");

    request = make_request();
    request.port.reset();
    CHECK(f.registry->create(request).error_message() == "port is required");

    request = make_request();
    request.port = 70000;
    auto bad_port = f.registry->create(request);
    CHECK(bad_port.error_code() == ErrorCode::INVALID_ARGUMENT);
    CHECK(bad_port.error_message() == "port must be between 1 and 65535, got 70000");

    request = make_request();
    request.database = "  ";
    CHECK(f.registry->create(request).error_message() == "database is required");

    request = make_request();
    request.idle_timeout_ms = 0;
    auto bad_timeout = f.registry->create(request);
    CHECK(bad_timeout.error_code() == ErrorCode::INVALID_ARGUMENT);
    CHECK(bad_timeout.error_message() == "idleTimeout must be between 1 and 2147483647 ms, got 0");

    // Longer waits overflow the pool's nanosecond clock
    request = make_request();
    request.connection_timeout_ms = int64_t{std::numeric_limits<int32_t>::max()} + 1;
    auto huge_timeout = f.registry->create(request);
    CHECK(huge_timeout.error_code() == ErrorCode::INVALID_ARGUMENT);
    CHECK(huge_timeout.error_message() ==
          "connectionTimeout must be between 1 and 2147483647 ms, got 2147483648");

    // Nothing was built for any of them
    CHECK(f.backend->pools_created == 0);
    CHECK(f.registry->size() == 0);
}

TEST_CASE("Registry: unreachable endpoint yields no handle", "[registry][validation]") {
    RegistryFixture f;
    f.db->reachable = false;
    f.db->connect_error = "Unknown MySQL server host 'nowhere'";

    auto created = f.registry->create(make_request("nowhere"));
    REQUIRE(created.is_error());
    CHECK(created.error_code() == ErrorCode::CONNECTION_UNAVAILABLE);
    CHECK(created.error_message() == "Cannot establish connection: Unknown MySQL server host 'nowhere'");
    CHECK(f.registry->size() == 0);
    CHECK(f.registry->list().empty());
}

TEST_CASE("Registry: failing validation query yields no handle", "[registry][validation]") {
    RegistryFixture f;
    f.db->healthy = false;

    auto created = f.registry->create(make_request());
    REQUIRE(created.is_error());
    CHECK(created.error_code() == ErrorCode::CONNECTION_UNAVAILABLE);
    CHECK(created.error_message() == "Cannot establish connection: validation query failed");
    CHECK(f.registry->size() == 0);
}

TEST_CASE("Registry: engine not available is INVALID_ARGUMENT", "[registry]") {
    auto registry = std::make_shared<ConnectionRegistry>(ConnectionRegistry::Config{},
        [](DatabaseType) -> std::shared_ptr<IDbBackend> { return nullptr; });

    auto request = make_request();
    request.type = DatabaseType::POSTGRESQL;
    auto created = registry->create(request);
    REQUIRE(created.is_error());
    CHECK(created.error_code() == ErrorCode::INVALID_ARGUMENT);
    CHECK(created.error_message() == "Database type 'postgresql' is not available in this build");
}

TEST_CASE("Registry: pool config carries registry defaults and overrides", "[registry][pool]") {
    RegistryFixture f;
    ConnectionRegistry::Config config;
    config.max_connections = 7;
    config.min_idle = 2;
    config.validation_query = "SELECT 42";
    auto registry = make_registry(f.backend, config);

    auto request = make_request();
    request.connection_timeout_ms = 1500;
    request.max_lifetime_ms = 60000;
    REQUIRE(registry->create(request).is_ok());

    const auto& pc = f.backend->last_pool_config;
    CHECK(pc.max_connections == 7);
    CHECK(pc.min_connections == 2);
    CHECK(pc.health_check_query == "SELECT 42");
    CHECK(pc.connection_timeout == std::chrono::milliseconds(1500));
    CHECK(pc.idle_timeout == config.default_timeouts.idle_timeout);
    CHECK(pc.max_lifetime == std::chrono::milliseconds(60000));
}

TEST_CASE("Registry: list is in creation order", "[registry]") {
    RegistryFixture f;
    std::vector<std::string> handles;
    for (int i = 0; i < 5; ++i) {
        auto created = f.registry->create(make_request("h" + std::to_string(i)));
        REQUIRE(created.is_ok());
        handles.push_back(created.value().handle);
    }

    const auto listed = f.registry->list();
    REQUIRE(listed.size() == 5);
    for (size_t i = 0; i < 5; ++i) {
        CHECK(listed[i].handle == handles[i]);
        CHECK(listed[i].url.starts_with("mysql://h" + std::to_string(i) + ":3306/shop"));
    }
}

TEST_CASE("Registry: close succeeds exactly once", "[registry][close]") {
    RegistryFixture f;
    auto created = f.registry->create(make_request());
    REQUIRE(created.is_ok());
    const auto handle = created.value().handle;

    auto managed = f.registry->get(handle);
    REQUIRE(managed.is_ok());
    auto pool = managed.value()->pool;

    CHECK(f.registry->close(handle));
    CHECK_FALSE(f.registry->close(handle));
    CHECK(pool->is_drained());

    auto after = f.registry->get(handle);
    REQUIRE(after.is_error());
    CHECK(after.error_code() == ErrorCode::UNKNOWN_HANDLE);
    CHECK(after.error_message() == "Unknown connectionId: " + handle);
}

TEST_CASE("Registry: unknown handle lookups", "[registry]") {
    RegistryFixture f;
    CHECK(f.registry->get("does-not-exist").error_code() == ErrorCode::UNKNOWN_HANDLE);
    CHECK_FALSE(f.registry->close("does-not-exist"));
}

TEST_CASE("Registry: close_all drains every pool", "[registry][close]") {
    RegistryFixture f;
    std::vector<std::shared_ptr<IConnectionPool>> pools;
    for (int i = 0; i < 3; ++i) {
        auto created = f.registry->create(make_request());
        REQUIRE(created.is_ok());
        pools.push_back(f.registry->get(created.value().handle).value()->pool);
    }

    CHECK(f.registry->close_all() == 3);
    CHECK(f.registry->size() == 0);
    for (const auto& pool : pools) {
        CHECK(pool->is_drained());
    }
    CHECK(f.registry->close_all() == 0);
}

TEST_CASE("Registry: housekeeper retires idle connections on quiet handles", "[registry][pool]") {
    auto db = std::make_shared<MockDatabase>();
    auto backend = std::make_shared<MockBackend>(db);

    ConnectionRegistry::Config config;
    config.max_connections = 3;
    config.min_idle = 1;
    config.default_timeouts.idle_timeout = std::chrono::milliseconds(50);
    config.housekeeping_interval = std::chrono::milliseconds(20);
    auto registry = make_registry(backend, config);

    auto created = registry->create(make_request());
    REQUIRE(created.is_ok());
    auto pool = registry->get(created.value().handle).value()->pool;

    {
        auto a = pool->acquire();
        auto b = pool->acquire();
        REQUIRE(a != nullptr);
        REQUIRE(b != nullptr);
    }
    CHECK(db->connects == 2);

    // No further acquire: only the housekeeper can shrink the pool
    CHECK(eventually([&] { return pool->get_stats().total_connections == 1; }));
    CHECK(pool->get_stats().idle_evictions == 1);
    CHECK(db->connects == 2);
}

TEST_CASE("Registry: housekeep pass covers every live pool", "[registry][pool]") {
    auto db = std::make_shared<MockDatabase>();
    auto backend = std::make_shared<MockBackend>(db);

    ConnectionRegistry::Config config;
    config.min_idle = 1;
    config.default_timeouts.max_lifetime = std::chrono::milliseconds(50);
    config.housekeeping_interval = std::chrono::milliseconds(0);
    auto registry = make_registry(backend, config);

    REQUIRE(registry->create(make_request()).is_ok());
    REQUIRE(registry->create(make_request()).is_ok());
    CHECK(db->connects == 2);

    std::this_thread::sleep_for(std::chrono::milliseconds(120));

    // Both aged warm connections are replaced
    CHECK(registry->housekeep() == 2);
    CHECK(db->connects == 4);
    CHECK(registry->size() == 2);
}

TEST_CASE("Registry: bounded close_all reports the handles it closed", "[registry][close]") {
    RegistryFixture f;
    REQUIRE(f.registry->create(make_request()).is_ok());
    REQUIRE(f.registry->create(make_request()).is_ok());

    const auto closed = close_all_within(f.registry, std::chrono::seconds(5));
    REQUIRE(closed.has_value());
    CHECK(*closed == 2);
    CHECK(f.registry->size() == 0);
}

TEST_CASE("Registry: bounded close_all gives up on a slow endpoint", "[registry][close]") {
    RegistryFixture f;
    REQUIRE(f.registry->create(make_request()).is_ok());
    f.db->close_delay = std::chrono::milliseconds(300);

    const auto closed = close_all_within(f.registry, std::chrono::milliseconds(20));
    CHECK_FALSE(closed.has_value());

    // The helper still finishes and then lets go of the registry
    CHECK(eventually([&] { return f.db->closes == 1 && f.registry.use_count() == 1; }));
    CHECK(f.registry->size() == 0);
}

TEST_CASE("Registry: concurrent creates yield distinct handles", "[registry][concurrency]") {
    RegistryFixture f;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 10;

    std::mutex mutex;
    std::set<std::string> handles;
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kPerThread; ++i) {
                auto created = f.registry->create(make_request());
                if (!created.is_ok()) {
                    failures.fetch_add(1);
                    continue;
                }
                std::lock_guard lock(mutex);
                handles.insert(created.value().handle);
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(failures == 0);
    CHECK(handles.size() == kThreads * kPerThread);
    CHECK(f.registry->size() == kThreads * kPerThread);
}
