#include "audit/write_audit_log.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "db/backend_registry.hpp"
#include "executor/result_shaper.hpp"
#include "policy/write_gate.hpp"
#include "registry/connection_registry.hpp"
#include "server/http_server.hpp"
#include "server/mcp_dispatcher.hpp"
#include "server/stdio_transport.hpp"
#include "server/tool_registry.hpp"
#include "tools/sql_tool_handlers.hpp"
#include "tools/sql_tool_service.hpp"

#ifdef SQLGATE_ENABLE_MYSQL
#include "db/mysql/mysql_backend.hpp"
#endif
#ifdef SQLGATE_ENABLE_POSTGRESQL
#include "db/postgresql/pg_backend.hpp"
#endif

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

#ifndef SQLGATE_VERSION
#define SQLGATE_VERSION "1.0.0"
#endif

using namespace sqlgate;

// Global instances for signal handling
std::shared_ptr<HttpServer> g_server;
std::shared_ptr<StdioTransport> g_stdio;
std::shared_ptr<ConnectionRegistry> g_registry;

// =========================================================================
// Explicit Backend Registration (ensures linker includes backend objects)
// =========================================================================

static void register_backends() {
    #ifdef SQLGATE_ENABLE_POSTGRESQL
    BackendRegistry::instance().register_backend(
        DatabaseType::POSTGRESQL,
        [] { return std::make_unique<PgBackend>(); });
    #endif

    #ifdef SQLGATE_ENABLE_MYSQL
    BackendRegistry::instance().register_backend(
        DatabaseType::MYSQL,
        [] { return std::make_unique<MysqlBackend>(); });
    #endif
}

/**
 * @brief Close every live handle, giving up after timeout
 *
 * A pool stuck on an unreachable server must not hold the process hostage.
 * On timeout the closing thread may still touch the registry, so the
 * process exits without running static destructors.
 */
static void close_all_connections(std::shared_ptr<ConnectionRegistry> registry,
                                  std::chrono::milliseconds timeout) {
    if (!registry) return;

    if (const auto closed = close_all_within(std::move(registry), timeout)) {
        utils::log::info(std::format("Closed {} connection(s)", *closed));
        return;
    }

    utils::log::warn(std::format("Shutdown timeout: connections still closing after {}ms, exiting",
        timeout.count()));
    std::cout.flush();
    std::cerr.flush();
    std::_Exit(EXIT_FAILURE);
}

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));

    if (g_server) {
        // start() returns and main() runs the regular shutdown path
        g_server->stop();
        return;
    }

    // stdio: the reader is blocked in getline, finish here
    if (g_stdio) {
        g_stdio->stop();
    }
    if (g_registry) {
        g_registry->close_all();
    }
    std::_Exit(0);
}

static void print_usage(const char* argv0) {
    std::cerr << std::format("Usage: {} [config.toml] [--stdio]\n", argv0);
}

int main(int argc, char* argv[]) {
    try {
        // Register all available backends
        register_backends();

        std::string config_file = "config/sqlgate.toml";
        bool force_stdio = false;
        for (int i = 1; i < argc; ++i) {
            const std::string_view arg = argv[i];
            if (arg == "--stdio") {
                force_stdio = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (!arg.empty() && arg.front() == '-') {
                print_usage(argv[0]);
                return 2;
            } else {
                config_file = std::string(arg);
            }
        }

        utils::log::info(std::format("sqlgate {} starting...", SQLGATE_VERSION));

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // =====================================================================
        // [1/5] Configuration
        // =====================================================================
        utils::log::info(std::format("[1/5] Loading configuration from {}", config_file));

        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        auto config = std::move(config_result.config);
        if (force_stdio) {
            config.server.transport = Transport::STDIO;
        }
        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        // =====================================================================
        // [2/5] Database backends
        // =====================================================================
        const std::string engines = BackendRegistry::instance().describe();
        if (engines.empty()) {
            utils::log::warn("[2/5] No database backend compiled in; createConnection will fail");
        } else {
            utils::log::info(std::format("[2/5] Database backends: {}", engines));
        }

        // =====================================================================
        // [3/5] Registry, write gate, shaper, audit
        // =====================================================================
        g_registry = std::make_shared<ConnectionRegistry>(config.pool);
        auto gate = std::make_shared<WriteGate>(config.write);
        auto shaper = std::make_shared<ResultShaper>(config.limits);
        auto audit = std::make_shared<WriteAuditLog>(config.audit);

        utils::log::info(std::format(
            "[3/5] Pools: max={} min_idle={} timeout={}ms; writes {} ({} whitelisted verbs); "
            "limits rows={} field={}; audit {} (capacity {})",
            config.pool.max_connections, config.pool.min_idle,
            config.pool.default_timeouts.connection_timeout.count(),
            gate->is_enabled() ? "enabled" : "disabled", gate->list().size(),
            shaper->max_query_rows(), shaper->max_field_length(),
            audit->is_enabled() ? "enabled" : "disabled", audit->capacity()));

        // =====================================================================
        // [4/5] MCP tools
        // =====================================================================
        auto service = std::make_shared<SqlToolService>(g_registry, gate, shaper, audit);
        auto tools = std::make_shared<ToolRegistry>();
        const size_t tool_count = register_sql_tools(*tools, service);
        auto dispatcher = std::make_shared<const McpDispatcher>(
            tools, McpDispatcher::Config{.server_name = "sqlgate", .server_version = SQLGATE_VERSION});
        utils::log::info(std::format("[4/5] MCP tools: {} registered", tool_count));

        // =====================================================================
        // [5/5] Transport (blocking)
        // =====================================================================
        if (config.server.transport == Transport::STDIO) {
            utils::log::info("[5/5] Transport: stdio");
            g_stdio = std::make_shared<StdioTransport>(dispatcher, std::cin, std::cout);
            g_stdio->run();
        } else {
            HttpServer::Config http_cfg{
                .host = config.server.host,
                .port = static_cast<int>(config.server.port),
                .threads = static_cast<size_t>(config.server.threads),
                .mcp_path = config.server.mcp_path,
            };
            utils::log::info(std::format("[5/5] Transport: http://{}:{}{}",
                http_cfg.host, http_cfg.port, http_cfg.mcp_path));
            auto registry = g_registry;
            g_server = std::make_shared<HttpServer>(dispatcher, http_cfg,
                [registry] { return registry->size(); });
            g_server->start();
        }

        close_all_connections(g_registry,
            std::chrono::milliseconds{config.server.shutdown_timeout_ms});
        utils::log::info("sqlgate stopped");

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
