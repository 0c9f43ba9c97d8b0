#pragma once

#include "audit/write_audit_log.hpp"
#include "executor/result_shaper.hpp"
#include "policy/write_gate.hpp"
#include "registry/connection_registry.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sqlgate {

// ============================================================================
// Configuration Types
// ============================================================================

enum class Transport {
    HTTP,
    STDIO,
};

[[nodiscard]] inline std::optional<Transport> parse_transport(std::string_view name) {
    if (name == "http") return Transport::HTTP;
    if (name == "stdio") return Transport::STDIO;
    return std::nullopt;
}

struct ServerConfig {
    std::string host = "127.0.0.1";
    int64_t port = 8080;
    int64_t threads = 8;
    std::string mcp_path = "/mcp";
    Transport transport = Transport::HTTP;
    int64_t shutdown_timeout_ms = 5000;     // bound on draining pools at exit
};

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief Whole-process configuration ([server], [logging], [write],
 * [audit], [limits], [pool])
 *
 * Component sections reuse the components' own Config structs.
 */
struct SqlGateConfig {
    ServerConfig server;
    LoggingConfig logging;
    WriteGate::Config write;
    WriteAuditLog::Config audit;
    ResultShaper::Config limits;
    ConnectionRegistry::Config pool;
};

} // namespace sqlgate
