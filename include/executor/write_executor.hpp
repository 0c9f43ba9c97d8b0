#pragma once

#include "audit/write_audit_log.hpp"
#include "core/error.hpp"
#include "policy/write_gate.hpp"
#include <cstdint>
#include <string>

namespace sqlgate {

struct ManagedConnection;

/**
 * @brief Write-path executor
 *
 * Order of checks: write switch (WRITES_DISABLED), verb whitelist
 * (STATEMENT_NOT_ALLOWED), then a single execution. Only a successful
 * execution is audited; a driver failure leaves the audit log untouched.
 */
class WriteExecutor {
public:
    WriteExecutor(const WriteGate& gate, WriteAuditLog& audit);

    /**
     * @return Affected row count reported by the driver
     */
    [[nodiscard]] Result<uint64_t> execute(ManagedConnection& conn, const std::string& statement);

private:
    const WriteGate& gate_;
    WriteAuditLog& audit_;
};

} // namespace sqlgate
