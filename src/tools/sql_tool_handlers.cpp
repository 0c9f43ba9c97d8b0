#include "tools/sql_tool_handlers.hpp"
#include "core/database_type.hpp"
#include "core/utils.hpp"
#include "tools/json_render.hpp"

#include <format>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string_view>

namespace sqlgate {

namespace {

using ToolResult = Result<std::string>;

// ============================================================================
// Input schemas
// ============================================================================

struct Param {
    std::string_view name;
    std::string_view type;          // JSON Schema type
    std::string_view description;
    bool required = false;
};

std::string make_schema(std::initializer_list<Param> params) {
    std::string properties;
    std::string required;
    for (const auto& p : params) {
        if (!properties.empty()) properties += ',';
        properties += std::format(R"({}:{{"type":"{}","description":{}}})",
            utils::json_string(p.name), p.type, utils::json_string(p.description));
        if (p.required) {
            if (!required.empty()) required += ',';
            required += utils::json_string(p.name);
        }
    }
    return std::format(R"({{"type":"object","properties":{{{}}},"required":[{}]}})",
        properties, required);
}

// ============================================================================
// Argument parsing
// ============================================================================

/**
 * @brief Typed access to a tool's arguments object, keeping the first error
 *
 * Integers are also accepted as numeric strings ("3306"), since some
 * clients send every argument as text.
 */
class ArgReader {
public:
    explicit ArgReader(const JsonValue& args) : args_(args) {}

    std::optional<std::string> str(std::string_view key) {
        const JsonValue v = args_[key];
        if (v.is_null()) return std::nullopt;
        if (v.is_string()) return v.get<std::string>();
        fail(std::format("{} must be a string", key));
        return std::nullopt;
    }

    std::optional<int64_t> integer(std::string_view key) {
        const JsonValue v = args_[key];
        if (v.is_null()) return std::nullopt;
        if (v.is_number_integer()) {
            if (const auto parsed = v.as_integer<int64_t>()) return parsed;
            fail(std::format("{} is out of range", key));
            return std::nullopt;
        }
        if (v.is_string()) {
            if (const auto parsed = utils::try_parse_int<int64_t>(utils::trim(v.get<std::string>()))) {
                return parsed;
            }
        }
        fail(std::format("{} must be an integer", key));
        return std::nullopt;
    }

    std::string required_str(std::string_view key) {
        auto v = str(key);
        if (!v) {
            fail(std::format("{} is required", key));
            return {};
        }
        return std::move(*v);
    }

    int64_t required_integer(std::string_view key) {
        const auto v = integer(key);
        if (!v) {
            fail(std::format("{} is required", key));
            return 0;
        }
        return *v;
    }

    [[nodiscard]] bool failed() const { return !error_.empty(); }

    [[nodiscard]] ToolResult error() const {
        return ToolResult::error(ErrorCode::INVALID_ARGUMENT, error_);
    }

private:
    void fail(std::string message) {
        if (error_.empty()) error_ = std::move(message);
    }

    const JsonValue& args_;
    std::string error_;
};

template<typename T>
ToolResult render_or_error(const Result<T>& result, std::string (*to_json)(const T&)) {
    if (result.is_error()) {
        return ToolResult::propagate(result);
    }
    return ToolResult::ok(to_json(result.value()));
}

std::string render_bool(bool value) { return utils::booltostr(value); }

// ============================================================================
// Handlers
// ============================================================================

ToolResult create_connection(SqlToolService& service, const JsonValue& args, bool advanced) {
    ArgReader in(args);

    ConnectionRequest request;
    request.host = in.str("host");
    request.port = in.integer("port");
    request.database = in.str("database");
    request.user = in.str("username").value_or("");
    request.password = in.str("password").value_or("");
    request.params = in.str("params");

    const auto db_type = in.str("dbType");
    if (advanced) {
        request.connection_timeout_ms = in.integer("connectionTimeoutMs");
        request.idle_timeout_ms = in.integer("idleTimeoutMs");
        request.max_lifetime_ms = in.integer("maxLifetimeMs");
    }
    if (in.failed()) {
        return in.error();
    }

    if (db_type && !utils::trim(*db_type).empty()) {
        const auto parsed = parse_database_type(utils::trim(*db_type));
        if (!parsed) {
            return ToolResult::error(ErrorCode::INVALID_ARGUMENT,
                std::format("Unsupported dbType: {}", *db_type));
        }
        request.type = *parsed;
    }

    return render_or_error(service.create_connection(request), &render::connection);
}

ToolResult query_with_connection(SqlToolService& service, const JsonValue& args) {
    ArgReader in(args);
    const auto handle = in.required_str("connectionId");
    const auto sql = in.str("sql").value_or("");
    if (in.failed()) return in.error();

    return render_or_error(service.query_with_connection(handle, sql), &render::rows);
}

ToolResult execute_update_with_connection(SqlToolService& service, const JsonValue& args) {
    ArgReader in(args);
    const auto handle = in.required_str("connectionId");
    const auto sql = in.str("sql").value_or("");
    if (in.failed()) return in.error();

    const auto affected = service.execute_update_with_connection(handle, sql);
    if (affected.is_error()) {
        return ToolResult::propagate(affected);
    }
    return ToolResult::ok(std::to_string(affected.value()));
}

ToolResult set_limit(const JsonValue& args, std::string_view key,
                     const std::function<Result<int64_t>(int64_t)>& setter) {
    ArgReader in(args);
    const auto value = in.required_integer(key);
    if (in.failed()) return in.error();

    const auto previous = setter(value);
    if (previous.is_error()) {
        return ToolResult::propagate(previous);
    }
    return ToolResult::ok(std::to_string(previous.value()));
}

} // anonymous namespace

size_t register_sql_tools(ToolRegistry& registry, std::shared_ptr<SqlToolService> service) {
    const size_t before = registry.size();

    const Param host{"host", "string", "Database host, e.g. 127.0.0.1", true};
    const Param port{"port", "integer", "Database port, e.g. 3306 or 5432", true};
    const Param database{"database", "string", "Database (schema) name", true};
    const Param username{"username", "string", "Login user", false};
    const Param password{"password", "string", "Login password", false};
    const Param params{"params", "string",
        "Extra driver parameters as key=value pairs joined by '&'. "
        "Blank uses safe defaults (no TLS, UTF-8, UTC)", false};
    const Param db_type{"dbType", "string", "mysql (default), mariadb or postgresql", false};
    const Param connection_id{"connectionId", "string", "Id returned by createConnection", true};
    const Param keyword{"keyword", "string", "Statement keyword, e.g. insert", true};

    registry.register_tool(
        {"createConnection",
         "Create a new database connection. Return a generated connectionId. "
         "Subsequent queries must include this id.",
         make_schema({host, port, database, username, password, params, db_type})},
        [service](const JsonValue& args) { return create_connection(*service, args, false); });

    registry.register_tool(
        {"createConnectionAdvanced",
         "Create a new database connection with advanced pool tuning (timeouts in ms). "
         "Return connectionId.",
         make_schema({host, port, database, username, password, params, db_type,
                      {"connectionTimeoutMs", "integer", "Pool acquire and connect timeout", false},
                      {"idleTimeoutMs", "integer", "Idle time before a spare connection is retired", false},
                      {"maxLifetimeMs", "integer", "Age at which a connection is recycled", false}})},
        [service](const JsonValue& args) { return create_connection(*service, args, true); });

    registry.register_tool(
        {"listConnections", "List all active connectionIds and their connection urls.", make_schema({})},
        [service](const JsonValue&) {
            return ToolResult::ok(render::connections(service->list_connections()));
        });

    registry.register_tool(
        {"closeConnection", "Close and remove a connection by connectionId. Return true if removed.",
         make_schema({connection_id})},
        [service](const JsonValue& args) {
            ArgReader in(args);
            const auto handle = in.required_str("connectionId");
            if (in.failed()) return in.error();
            return ToolResult::ok(render_bool(service->close_connection(handle)));
        });

    registry.register_tool(
        {"queryWithConnection",
         "Execute a SELECT SQL on the specified connectionId and return rows. "
         "Rows and text fields are capped by the result limits. Only SELECT allowed.",
         make_schema({connection_id, {"sql", "string", "SELECT statement", true}})},
        [service](const JsonValue& args) { return query_with_connection(*service, args); });

    registry.register_tool(
        {"executeUpdateWithConnection",
         "Execute a non-SELECT (INSERT/UPDATE/DELETE/DDL) SQL if writes are enabled and its "
         "first keyword is in the whitelist. Returns affected rows.",
         make_schema({connection_id, {"sql", "string", "Single write or DDL statement", true}})},
        [service](const JsonValue& args) { return execute_update_with_connection(*service, args); });

    registry.register_tool(
        {"listAllTablesName", "List all table names (comma separated) for the given connectionId.",
         make_schema({connection_id})},
        [service](const JsonValue& args) {
            ArgReader in(args);
            const auto handle = in.required_str("connectionId");
            if (in.failed()) return in.error();
            const auto tables = service->list_all_tables_name(handle);
            if (tables.is_error()) return ToolResult::propagate(tables);
            return ToolResult::ok(utils::json_string(tables.value()));
        });

    registry.register_tool(
        {"getTableSchema",
         "Get table schema (COLUMN_NAME, DATA_TYPE, IS_NULLABLE, COLUMN_DEFAULT) for a table "
         "on the given connectionId.",
         make_schema({connection_id, {"tableName", "string", "Table name", true}})},
        [service](const JsonValue& args) {
            ArgReader in(args);
            const auto handle = in.required_str("connectionId");
            const auto table = in.str("tableName").value_or("");
            if (in.failed()) return in.error();
            return render_or_error(service->get_table_schema(handle, table), &render::rows);
        });

    registry.register_tool(
        {"enableWriteOperations",
         "Enable non-SELECT (write/DDL) operations globally. Return true if state changed.",
         make_schema({})},
        [service](const JsonValue&) {
            return ToolResult::ok(render_bool(service->enable_write_operations()));
        });

    registry.register_tool(
        {"disableWriteOperations",
         "Disable non-SELECT (write/DDL) operations globally. Return true if state changed.",
         make_schema({})},
        [service](const JsonValue&) {
            return ToolResult::ok(render_bool(service->disable_write_operations()));
        });

    registry.register_tool(
        {"isWriteEnabled", "Return whether non-SELECT (write/DDL) operations are currently enabled.",
         make_schema({})},
        [service](const JsonValue&) {
            return ToolResult::ok(render_bool(service->is_write_enabled()));
        });

    registry.register_tool(
        {"listWriteWhitelist", "List current non-SELECT whitelist keywords.", make_schema({})},
        [service](const JsonValue&) {
            return ToolResult::ok(render::string_array(service->list_write_whitelist()));
        });

    registry.register_tool(
        {"addAllowedWriteCommand", "Add a keyword to the non-SELECT whitelist. Return true if added.",
         make_schema({keyword})},
        [service](const JsonValue& args) {
            ArgReader in(args);
            const auto kw = in.required_str("keyword");
            if (in.failed()) return in.error();
            return ToolResult::ok(render_bool(service->add_allowed_write_command(kw)));
        });

    registry.register_tool(
        {"removeAllowedWriteCommand", "Remove a keyword from the whitelist. Return true if removed.",
         make_schema({keyword})},
        [service](const JsonValue& args) {
            ArgReader in(args);
            const auto kw = in.required_str("keyword");
            if (in.failed()) return in.error();
            return ToolResult::ok(render_bool(service->remove_allowed_write_command(kw)));
        });

    registry.register_tool(
        {"setMaxQueryRows", "Set maximum rows returned by SELECT queries; returns previous value.",
         make_schema({{"rows", "integer", "New row cap (> 0)", true}})},
        [service](const JsonValue& args) {
            return set_limit(args, "rows",
                [&service](int64_t v) { return service->set_max_query_rows(v); });
        });

    registry.register_tool(
        {"setMaxFieldLength",
         "Set maximum field (string) length per cell; returns previous value. "
         "Longer values will be truncated with a suffix.",
         make_schema({{"length", "integer", "New text field cap in characters (> 0)", true}})},
        [service](const JsonValue& args) {
            return set_limit(args, "length",
                [&service](int64_t v) { return service->set_max_field_length(v); });
        });

    registry.register_tool(
        {"getResultLimitConfig", "Get current max query rows & field length limits.", make_schema({})},
        [service](const JsonValue&) {
            return ToolResult::ok(render::limits(service->get_result_limit_config()));
        });

    registry.register_tool(
        {"listWriteAudit",
         "Return write audit entries (most recent first) limited by 'limit'. Each entry contains: "
         "timestamp, connectionId, verb, durationMs, affectedRows.",
         make_schema({{"limit", "integer", "Maximum number of entries", true}})},
        [service](const JsonValue& args) {
            ArgReader in(args);
            const auto limit = in.required_integer("limit");
            if (in.failed()) return in.error();
            return ToolResult::ok(render::audit_entries(service->list_write_audit(limit)));
        });

    registry.register_tool(
        {"clearWriteAudit", "Clear all write audit entries; returns number cleared.", make_schema({})},
        [service](const JsonValue&) {
            return ToolResult::ok(std::to_string(service->clear_write_audit()));
        });

    return registry.size() - before;
}

} // namespace sqlgate
