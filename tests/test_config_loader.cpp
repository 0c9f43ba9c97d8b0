#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <chrono>
#include <cstdlib>

using namespace sqlgate;

namespace {

bool mentions(const std::string& message, const std::string& needle) {
    return message.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("Config: empty document yields defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& c = result.config;
    CHECK(c.server.host == "127.0.0.1");
    CHECK(c.server.port == 8080);
    CHECK(c.server.mcp_path == "/mcp");
    CHECK(c.server.transport == Transport::HTTP);
    CHECK(c.logging.level == "info");
    CHECK_FALSE(c.write.writes_enabled);
    CHECK(c.write.whitelist.size() == 8);
    CHECK(c.audit.enabled);
    CHECK(c.audit.max_entries == 1000);
    CHECK(c.limits.max_query_rows == 200);
    CHECK(c.limits.max_field_length == 256);
    CHECK(c.pool.max_connections == 5);
    CHECK(c.pool.min_idle == 1);
    CHECK(c.pool.validation_query == "SELECT 1");
}

TEST_CASE("Config: every section is read", "[config]") {
    const std::string toml = R"(
[server]
host = "0.0.0.0"
port = 9090
threads = 4
mcp_path = "/rpc"
transport = "STDIO"
shutdown_timeout_ms = 2000

[logging]
level = "debug"

[write]
enabled = true
whitelist = ["insert", "update"]

[audit]
enabled = false
max_entries = 25

[limits]
max_query_rows = 50
max_field_length = 80

[pool]
max_connections = 10
min_idle = 0
connection_timeout_ms = 2500
idle_timeout_ms = 60000
max_lifetime_ms = 900000
validation_query = "SELECT 2"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);

    const auto& c = result.config;
    CHECK(c.server.host == "0.0.0.0");
    CHECK(c.server.port == 9090);
    CHECK(c.server.threads == 4);
    CHECK(c.server.mcp_path == "/rpc");
    CHECK(c.server.transport == Transport::STDIO);
    CHECK(c.server.shutdown_timeout_ms == 2000);
    CHECK(c.logging.level == "debug");
    CHECK(c.write.writes_enabled);
    CHECK(c.write.whitelist == std::vector<std::string>{"insert", "update"});
    CHECK_FALSE(c.audit.enabled);
    CHECK(c.audit.max_entries == 25);
    CHECK(c.limits.max_query_rows == 50);
    CHECK(c.limits.max_field_length == 80);
    CHECK(c.pool.max_connections == 10);
    CHECK(c.pool.min_idle == 0);
    CHECK(c.pool.default_timeouts.connection_timeout == std::chrono::milliseconds(2500));
    CHECK(c.pool.default_timeouts.idle_timeout == std::chrono::milliseconds(60000));
    CHECK(c.pool.default_timeouts.max_lifetime == std::chrono::milliseconds(900000));
    CHECK(c.pool.validation_query == "SELECT 2");
}

TEST_CASE("Config: empty whitelist disables every verb", "[config]") {
    auto result = ConfigLoader::load_from_string("[write]\nwhitelist = []\n");
    REQUIRE(result.success);
    CHECK(result.config.write.whitelist.empty());
}

TEST_CASE("Config: invalid values are collected together", "[config][validation]") {
    const std::string toml = R"(
[server]
port = 70000
mcp_path = "mcp"
transport = "carrier-pigeon"

[logging]
level = "chatty"

[limits]
max_query_rows = 0

[audit]
max_entries = -1

[pool]
max_connections = 2
min_idle = 3
idle_timeout_ms = 0
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);

    const auto& msg = result.error_message;
    CHECK(msg.starts_with("Config validation failed:"));
    CHECK(mentions(msg, "server.port must be 1-65535, got 70000"));
    CHECK(mentions(msg, "server.mcp_path must start with '/'"));
    CHECK(mentions(msg, "server.transport must be 'http' or 'stdio'"));
    CHECK(mentions(msg, "logging.level"));
    CHECK(mentions(msg, "limits.max_query_rows must be > 0"));
    CHECK(mentions(msg, "audit.max_entries must be > 0"));
    CHECK(mentions(msg, "pool.min_idle (3) > pool.max_connections (2)"));
    CHECK(mentions(msg, "pool.idle_timeout_ms must be between 1 and 2147483647, got 0"));
}

TEST_CASE("Config: timeouts above the cap are rejected", "[config][validation]") {
    const std::string toml = R"(
[server]
shutdown_timeout_ms = 2147483648

[pool]
connection_timeout_ms = 9000000000000000000
housekeeping_interval_ms = -1
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);

    const auto& msg = result.error_message;
    CHECK(mentions(msg, "server.shutdown_timeout_ms must be between 1 and 2147483647, got 2147483648"));
    CHECK(mentions(msg, "pool.connection_timeout_ms must be between 1 and 2147483647"));
    CHECK(mentions(msg, "pool.housekeeping_interval_ms must be between 0 and 2147483647, got -1"));
}

TEST_CASE("Config: housekeeping interval", "[config][pool]") {
    auto defaults = ConfigLoader::load_from_string("");
    REQUIRE(defaults.success);
    CHECK(defaults.config.pool.housekeeping_interval == std::chrono::seconds(30));

    auto disabled = ConfigLoader::load_from_string("[pool]\nhousekeeping_interval_ms = 0\n");
    REQUIRE(disabled.success);
    CHECK(disabled.config.pool.housekeeping_interval.count() == 0);
}

TEST_CASE("Config: blank whitelist entry is rejected", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[write]\nwhitelist = [\"insert\", \"  \"]\n");
    REQUIRE_FALSE(result.success);
    CHECK(mentions(result.error_message, "write.whitelist[1] must not be blank"));
}

TEST_CASE("Config: malformed TOML is a parse failure", "[config]") {
    auto result = ConfigLoader::load_from_string("[server\nport = ");
    REQUIRE_FALSE(result.success);
    CHECK(mentions(result.error_message, "Failed to parse config"));
}

TEST_CASE("Config: missing file falls back to defaults", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/sqlgate-test.toml");
    REQUIRE(result.success);
    CHECK(result.config.server.port == 8080);
}

TEST_CASE("Config: ${VAR} is expanded from the environment", "[config][env]") {
    ::setenv("SQLGATE_TEST_HOST", "10.1.2.3", 1);
    ::unsetenv("SQLGATE_TEST_UNSET_XYZ");

    const std::string toml = R"(
[server]
host = "${SQLGATE_TEST_HOST}"

[pool]
validation_query = "SELECT 1${SQLGATE_TEST_UNSET_XYZ}"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.server.host == "10.1.2.3");
    CHECK(result.config.pool.validation_query == "SELECT 1");

    ::unsetenv("SQLGATE_TEST_HOST");
}

TEST_CASE("Config: unclosed ${ is a load error", "[config][env]") {
    auto result = ConfigLoader::load_from_string("[server]\nhost = \"${UNCLOSED\"\n");
    REQUIRE_FALSE(result.success);
    CHECK(mentions(result.error_message, "Unclosed env var substitution"));
}
