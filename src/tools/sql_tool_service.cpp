#include "tools/sql_tool_service.hpp"
#include "core/utils.hpp"

namespace sqlgate {

SqlToolService::SqlToolService(
    std::shared_ptr<ConnectionRegistry> registry,
    std::shared_ptr<WriteGate> gate,
    std::shared_ptr<ResultShaper> shaper,
    std::shared_ptr<WriteAuditLog> audit)
    : registry_(std::move(registry)),
      gate_(std::move(gate)),
      shaper_(std::move(shaper)),
      audit_(std::move(audit)),
      writer_(*gate_, *audit_) {}

Result<ConnectionInfo> SqlToolService::create_connection(const ConnectionRequest& request) {
    return registry_->create(request);
}

std::vector<ConnectionInfo> SqlToolService::list_connections() const {
    return registry_->list();
}

bool SqlToolService::close_connection(const std::string& handle) {
    return registry_->close(handle);
}

Result<std::vector<ResultRow>> SqlToolService::query_with_connection(
    const std::string& handle, const std::string& sql) {

    auto conn = registry_->get(handle);
    if (conn.is_error()) {
        return Result<std::vector<ResultRow>>::propagate(conn);
    }
    return shaper_->query(*conn.value(), sql);
}

Result<uint64_t> SqlToolService::execute_update_with_connection(
    const std::string& handle, const std::string& sql) {

    auto conn = registry_->get(handle);
    if (conn.is_error()) {
        return Result<uint64_t>::propagate(conn);
    }
    return writer_.execute(*conn.value(), sql);
}

Result<std::string> SqlToolService::list_all_tables_name(const std::string& handle) {
    auto conn = registry_->get(handle);
    if (conn.is_error()) {
        return Result<std::string>::propagate(conn);
    }

    const auto rows = shaper_->query(*conn.value(), conn.value()->backend->list_tables_query());
    if (rows.is_error()) {
        return Result<std::string>::propagate(rows);
    }

    std::string joined;
    for (const auto& row : rows.value()) {
        if (row.empty() || !row.front().value.data) continue;
        if (!joined.empty()) joined += ',';
        joined += *row.front().value.data;
    }
    return Result<std::string>::ok(std::move(joined));
}

Result<std::vector<ResultRow>> SqlToolService::get_table_schema(
    const std::string& handle, const std::string& table) {

    auto conn = registry_->get(handle);
    if (conn.is_error()) {
        return Result<std::vector<ResultRow>>::propagate(conn);
    }
    if (utils::trim(table).empty()) {
        return Result<std::vector<ResultRow>>::error(ErrorCode::INVALID_ARGUMENT, "tableName is required");
    }

    return shaper_->query(*conn.value(), conn.value()->backend->table_schema_query(table));
}

ResultLimits SqlToolService::get_result_limit_config() const {
    return ResultLimits{
        .max_query_rows = shaper_->max_query_rows(),
        .max_field_length = shaper_->max_field_length(),
    };
}

} // namespace sqlgate
