#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sqlgate {

/**
 * @brief Single-row-mode cursor over one PQsendQueryParams() call
 *
 * Each next() pulls one PGRES_SINGLE_TUPLE result. If the cursor is
 * destroyed before the final PGRES_TUPLES_OK, the running query is
 * cancelled server-side and the remaining results are discarded.
 */
class PgRowCursor : public IRowCursor {
public:
    /**
     * @param conn Connection with the query already dispatched in single-row mode
     * @param first First result from PQgetResult (ownership taken)
     */
    PgRowCursor(PGconn* conn, PGresult* first);
    ~PgRowCursor() override;

    PgRowCursor(const PgRowCursor&) = delete;
    PgRowCursor& operator=(const PgRowCursor&) = delete;

    const std::vector<ColumnTypeInfo>& columns() const override { return columns_; }
    bool next() override;
    std::optional<std::string_view> field(size_t index) const override;
    const std::string& error() const override { return error_; }

private:
    void take(PGresult* res);
    void finish(bool cancel);
    void decode_binary_fields();

    PGconn* conn_;
    PGresult* pending_ = nullptr;   // fetched but not yet handed out by next()
    PGresult* current_ = nullptr;
    bool done_ = false;
    std::vector<ColumnTypeInfo> columns_;
    std::vector<std::optional<std::string>> binary_;   // decoded bytea of the current row
    std::string error_;
};

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn* and provides database-agnostic interface.
 * All libpq calls are encapsulated here. Statements go through the
 * extended query protocol, which refuses more than one statement per call.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbExecResult execute(const std::string& sql) override;
    Result<std::unique_ptr<IRowCursor>> open_cursor(const std::string& sql) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    void close() override;

private:
    std::string last_error() const;

    PGconn* conn_;
};

/**
 * @brief PostgreSQL connection factory
 *
 * Creates PgConnection instances using PQconnectdbParams with the
 * postgresql:// URI expanded as dbname. connect_timeout in the URI wins
 * over the factory default.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    explicit PgConnectionFactory(
        std::chrono::milliseconds connect_timeout = std::chrono::milliseconds{10000});

    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;

    std::string last_error() const override;

private:
    void set_last_error(std::string message);

    std::chrono::milliseconds connect_timeout_;
    mutable std::mutex error_mutex_;
    std::string last_error_;
};

} // namespace sqlgate
