#pragma once

#include "audit/write_audit_log.hpp"
#include "executor/result_shaper.hpp"
#include "registry/connection_registry.hpp"
#include "tools/sql_tool_service.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace sqlgate::render {

/**
 * @brief True if text is a JSON number literal (RFC 8259 grammar) with a finite value
 */
[[nodiscard]] bool is_finite_json_number(std::string_view text);

/**
 * @brief One result cell as a JSON value
 *
 * NULL → null, BOOLEAN → true/false, numeric types → number when the
 * driver text is a finite JSON number, BLOB → base64 string, else string.
 */
[[nodiscard]] std::string field(const FieldValue& value);

/**
 * @brief Rows as an array of objects keyed by column label, in column order
 *
 * A label used by several columns appears once, at its first position,
 * holding the value of its last column.
 */
[[nodiscard]] std::string rows(const std::vector<ResultRow>& rows);

[[nodiscard]] std::string connection(const ConnectionInfo& info);
[[nodiscard]] std::string connections(const std::vector<ConnectionInfo>& list);
[[nodiscard]] std::string audit_entries(const std::vector<WriteAuditEntry>& entries);
[[nodiscard]] std::string limits(const ResultLimits& limits);
[[nodiscard]] std::string string_array(const std::vector<std::string>& values);

} // namespace sqlgate::render
