#pragma once

#include "audit/write_audit_log.hpp"
#include "core/error.hpp"
#include "executor/result_shaper.hpp"
#include "executor/write_executor.hpp"
#include "policy/write_gate.hpp"
#include "registry/connection_registry.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sqlgate {

struct ResultLimits {
    int64_t max_query_rows = 0;
    int64_t max_field_length = 0;
};

/**
 * @brief Operations exposed to MCP clients
 *
 * Thin orchestration over the registry, gate, shaper, executor and audit
 * log. Every handle-taking operation resolves the handle first, so an
 * absent or closed handle always reports UNKNOWN_HANDLE.
 */
class SqlToolService {
public:
    SqlToolService(
        std::shared_ptr<ConnectionRegistry> registry,
        std::shared_ptr<WriteGate> gate,
        std::shared_ptr<ResultShaper> shaper,
        std::shared_ptr<WriteAuditLog> audit);

    // ===== Connections =====

    /**
     * @brief createConnection / createConnectionAdvanced
     *
     * Timeout overrides left unset in the request use the registry defaults.
     */
    [[nodiscard]] Result<ConnectionInfo> create_connection(const ConnectionRequest& request);

    [[nodiscard]] std::vector<ConnectionInfo> list_connections() const;

    bool close_connection(const std::string& handle);

    // ===== Statements =====

    [[nodiscard]] Result<std::vector<ResultRow>> query_with_connection(
        const std::string& handle, const std::string& sql);

    [[nodiscard]] Result<uint64_t> execute_update_with_connection(
        const std::string& handle, const std::string& sql);

    /**
     * @brief Table names of the connection's current database, joined by ','
     */
    [[nodiscard]] Result<std::string> list_all_tables_name(const std::string& handle);

    [[nodiscard]] Result<std::vector<ResultRow>> get_table_schema(
        const std::string& handle, const std::string& table);

    // ===== Write policy =====

    bool enable_write_operations() { return gate_->enable(); }
    bool disable_write_operations() { return gate_->disable(); }
    [[nodiscard]] bool is_write_enabled() const { return gate_->is_enabled(); }

    [[nodiscard]] std::vector<std::string> list_write_whitelist() const { return gate_->list(); }
    bool add_allowed_write_command(const std::string& keyword) { return gate_->add(keyword); }
    bool remove_allowed_write_command(const std::string& keyword) { return gate_->remove(keyword); }

    // ===== Result limits =====

    Result<int64_t> set_max_query_rows(int64_t rows) { return shaper_->set_max_query_rows(rows); }
    Result<int64_t> set_max_field_length(int64_t length) { return shaper_->set_max_field_length(length); }
    [[nodiscard]] ResultLimits get_result_limit_config() const;

    // ===== Audit =====

    [[nodiscard]] std::vector<WriteAuditEntry> list_write_audit(int64_t limit) const {
        return audit_->list(limit);
    }
    size_t clear_write_audit() { return audit_->clear(); }

    [[nodiscard]] const ConnectionRegistry& registry() const { return *registry_; }

private:
    std::shared_ptr<ConnectionRegistry> registry_;
    std::shared_ptr<WriteGate> gate_;
    std::shared_ptr<ResultShaper> shaper_;
    std::shared_ptr<WriteAuditLog> audit_;
    WriteExecutor writer_;
};

} // namespace sqlgate
