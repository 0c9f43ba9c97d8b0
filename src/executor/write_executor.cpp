#include "executor/write_executor.hpp"
#include "core/utils.hpp"
#include "db/pooled_connection.hpp"
#include "registry/connection_registry.hpp"

#include <format>

namespace sqlgate {

WriteExecutor::WriteExecutor(const WriteGate& gate, WriteAuditLog& audit)
    : gate_(gate), audit_(audit) {}

Result<uint64_t> WriteExecutor::execute(ManagedConnection& conn, const std::string& statement) {
    using R = Result<uint64_t>;

    if (!gate_.is_enabled()) {
        utils::log::warn(std::format("Rejected write on {}: writes disabled", conn.handle));
        return R::error(ErrorCode::WRITES_DISABLED, "Write operations disabled");
    }

    const std::string verb = WriteGate::classify(statement);
    if (!gate_.is_allowed(verb)) {
        utils::log::warn(std::format("Rejected write on {}: verb '{}' not whitelisted", conn.handle, verb));
        return R::error(ErrorCode::STATEMENT_NOT_ALLOWED, std::format("SQL verb not allowed: {}", verb));
    }

    utils::Timer timer;

    auto pooled = conn.pool->acquire(conn.timeouts.connection_timeout);
    if (!pooled) {
        return R::error(ErrorCode::EXECUTION_FAILED,
            std::format("Update failed: {}", conn.pool->last_error()));
    }

    const auto result = (*pooled)->execute(statement);
    if (!result.success) {
        return R::error(ErrorCode::EXECUTION_FAILED,
            std::format("Update failed: {}", result.error_message));
    }

    const auto elapsed = timer.elapsed_ms();

    WriteAuditEntry entry;
    entry.handle = conn.handle;
    entry.verb = verb;
    entry.duration = elapsed;
    entry.affected_rows = result.affected_rows;
    entry.timestamp = std::chrono::system_clock::now();
    audit_.record(std::move(entry));

    utils::log::info(std::format("AUDIT write handle={} verb={} affected_rows={} duration_ms={}",
        conn.handle, verb, result.affected_rows, elapsed.count()));

    return R::ok(result.affected_rows);
}

} // namespace sqlgate
