#include "server/mcp_dispatcher.hpp"
#include "core/utils.hpp"

#include <array>
#include <exception>
#include <format>

namespace sqlgate {

namespace {

constexpr std::array<std::string_view, 3> kSupportedProtocolVersions = {
    "2024-11-05", "2025-03-26", "2025-06-18"};

std::string tool_result(std::string_view text, bool is_error) {
    return std::format(R"({{"content":[{{"type":"text","text":{}}}],"isError":{}}})",
        utils::json_string(text), utils::booltostr(is_error));
}

} // anonymous namespace

McpDispatcher::McpDispatcher(std::shared_ptr<const ToolRegistry> tools, Config config)
    : tools_(std::move(tools)), config_(std::move(config)) {}

std::string McpDispatcher::make_result(const std::string& id, const std::string& result) {
    return std::format(R"({{"jsonrpc":"2.0","id":{},"result":{}}})", id, result);
}

std::string McpDispatcher::make_error(const std::string& id, int code, std::string_view message) {
    return std::format(R"({{"jsonrpc":"2.0","id":{},"error":{{"code":{},"message":{}}}}})",
        id, code, utils::json_string(message));
}

std::optional<std::string> McpDispatcher::handle(const std::string& message) const {
    JsonValue request;
    try {
        request = JsonValue::parse(message);
    } catch (const JsonValue::parse_error& e) {
        utils::log::debug(std::format("Rejected unparseable message: {}", e.what()));
        return make_error("null", rpc::PARSE_ERROR, "Parse error");
    }

    if (!request.is_object()) {
        return make_error("null", rpc::INVALID_REQUEST, "Invalid Request");
    }

    const bool is_notification = !request.contains("id");
    const JsonValue id_node = request["id"];
    if (!is_notification && !id_node.is_string() && !id_node.is_number() && !id_node.is_null()) {
        return make_error("null", rpc::INVALID_REQUEST, "Invalid Request: id must be a string or number");
    }
    const std::string id = id_node.scalar_to_json();

    const JsonValue version = request["jsonrpc"];
    const JsonValue method_node = request["method"];
    if (!version.is_string() || version.get<std::string>() != "2.0" || !method_node.is_string()) {
        if (is_notification) return std::nullopt;
        return make_error(id, rpc::INVALID_REQUEST, "Invalid Request");
    }

    const std::string method = method_node.get<std::string>();
    const JsonValue params = request["params"];

    if (is_notification) {
        // notifications/initialized, notifications/cancelled, ...: nothing to do
        utils::log::debug(std::format("MCP notification: {}", method));
        return std::nullopt;
    }

    if (method == "initialize") {
        return handle_initialize(id, params);
    }
    if (method == "ping") {
        return make_result(id, "{}");
    }
    if (method == "tools/list") {
        return make_result(id, std::format(R"({{"tools":{}}})", tools_->list_json()));
    }
    if (method == "tools/call") {
        return handle_tools_call(id, params);
    }

    return make_error(id, rpc::METHOD_NOT_FOUND, std::format("Method not found: {}", method));
}

std::string McpDispatcher::handle_initialize(const std::string& id, const JsonValue& params) const {
    std::string_view version = LATEST_PROTOCOL_VERSION;
    const JsonValue requested = params["protocolVersion"];
    if (requested.is_string()) {
        const auto wanted = requested.get<std::string>();
        for (const auto v : kSupportedProtocolVersions) {
            if (v == wanted) version = v;
        }
    }

    const JsonValue client = params["clientInfo"];
    if (client.is_object()) {
        utils::log::info(std::format("MCP client connected: {} {} (protocol {})",
            client.value<std::string>("name", "unknown"),
            client.value<std::string>("version", ""), version));
    }

    return make_result(id, std::format(
        R"({{"protocolVersion":"{}","capabilities":{{"tools":{{"listChanged":false}}}},)"
        R"("serverInfo":{{"name":{},"version":{}}}}})",
        version, utils::json_string(config_.server_name), utils::json_string(config_.server_version)));
}

std::string McpDispatcher::handle_tools_call(const std::string& id, const JsonValue& params) const {
    if (!params.is_object()) {
        return make_error(id, rpc::INVALID_PARAMS, "Invalid params: expected an object");
    }

    const JsonValue name_node = params["name"];
    if (!name_node.is_string()) {
        return make_error(id, rpc::INVALID_PARAMS, "Invalid params: missing tool name");
    }
    const std::string name = name_node.get<std::string>();

    const auto* tool = tools_->find(name);
    if (!tool) {
        return make_error(id, rpc::INVALID_PARAMS, std::format("Unknown tool: {}", name));
    }

    JsonValue arguments = params["arguments"];
    if (arguments.is_null()) {
        arguments = JsonValue(glz::json_t(JsonValue::object_t{}));
    } else if (!arguments.is_object()) {
        return make_error(id, rpc::INVALID_PARAMS, "Invalid params: arguments must be an object");
    }

    try {
        const auto result = tool->handler(arguments);
        if (result.is_error()) {
            return make_result(id, tool_result(std::format("{}: {}",
                error_code_to_string(result.error_code()), result.error_message()), true));
        }
        return make_result(id, tool_result(result.value(), false));
    } catch (const std::exception& e) {
        utils::log::error(std::format("Tool '{}' threw: {}", name, e.what()));
        return make_result(id, tool_result(std::format("{}: {}",
            error_code_to_string(ErrorCode::INTERNAL_ERROR), e.what()), true));
    }
}

} // namespace sqlgate
