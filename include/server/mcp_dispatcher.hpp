#pragma once

#include "core/json.hpp"
#include "server/tool_registry.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sqlgate {

namespace rpc {
    inline constexpr int PARSE_ERROR = -32700;
    inline constexpr int INVALID_REQUEST = -32600;
    inline constexpr int METHOD_NOT_FOUND = -32601;
    inline constexpr int INVALID_PARAMS = -32602;
    inline constexpr int INTERNAL_ERROR = -32603;
}

/**
 * @brief MCP JSON-RPC 2.0 message handler (transport-independent)
 *
 * Methods: initialize, ping, tools/list, tools/call. Messages without an
 * id are notifications and produce no response. Tool failures come back
 * as a successful JSON-RPC result with isError=true, so the model sees
 * the message; protocol misuse maps to JSON-RPC error objects.
 */
class McpDispatcher {
public:
    struct Config {
        std::string server_name = "sqlgate";
        std::string server_version = "1.0.0";
    };

    static constexpr std::string_view LATEST_PROTOCOL_VERSION = "2025-06-18";

    McpDispatcher(std::shared_ptr<const ToolRegistry> tools, Config config);
    explicit McpDispatcher(std::shared_ptr<const ToolRegistry> tools)
        : McpDispatcher(std::move(tools), Config{}) {}

    /**
     * @brief Handle one JSON-RPC message
     * @return Serialized response, or nullopt for notifications
     */
    [[nodiscard]] std::optional<std::string> handle(const std::string& message) const;

    // Response builders (id is already-serialized JSON)
    [[nodiscard]] static std::string make_result(const std::string& id, const std::string& result);
    [[nodiscard]] static std::string make_error(const std::string& id, int code, std::string_view message);

private:
    [[nodiscard]] std::string handle_initialize(const std::string& id, const JsonValue& params) const;
    [[nodiscard]] std::string handle_tools_call(const std::string& id, const JsonValue& params) const;

    std::shared_ptr<const ToolRegistry> tools_;
    Config config_;
};

} // namespace sqlgate
