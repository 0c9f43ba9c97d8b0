#pragma once

#include "core/column_type.hpp"
#include "core/error.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlgate {

/**
 * @brief Outcome of a statement that produces no rows
 *
 * Returned by IDbConnection::execute().
 */
struct DbExecResult {
    bool success = false;
    std::string error_message;
    uint64_t affected_rows = 0;
};

/**
 * @brief Forward-only cursor over a streaming result
 *
 * Rows are pulled from the server one at a time; destroying the cursor
 * before exhaustion abandons the remaining rows without fetching them.
 * The cursor borrows the connection that opened it and must not outlive it.
 */
class IRowCursor {
public:
    virtual ~IRowCursor() = default;

    /**
     * @brief Column metadata in result order
     */
    [[nodiscard]] virtual const std::vector<ColumnTypeInfo>& columns() const = 0;

    /**
     * @brief Advance to the next row
     * @return false at end of result or on error (see error())
     */
    [[nodiscard]] virtual bool next() = 0;

    /**
     * @brief Raw field bytes of the current row, nullopt for SQL NULL
     *
     * Valid until the next call to next().
     */
    [[nodiscard]] virtual std::optional<std::string_view> field(size_t index) const = 0;

    /**
     * @brief Error raised while fetching, empty if none
     */
    [[nodiscard]] virtual const std::string& error() const = 0;
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*, MYSQL*).
 * Implementations are not thread-safe; thread safety comes from the pool.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a single statement that does not return rows
     * @param sql SQL text (exactly one statement)
     * @return Success flag, driver message and affected row count
     */
    [[nodiscard]] virtual DbExecResult execute(const std::string& sql) = 0;

    /**
     * @brief Start a row-returning statement and stream its result
     * @param sql SQL text (exactly one statement)
     * @return Cursor, or EXECUTION_FAILED carrying the driver message
     */
    [[nodiscard]] virtual Result<std::unique_ptr<IRowCursor>> open_cursor(const std::string& sql) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     * @return true if connection is usable
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace sqlgate
