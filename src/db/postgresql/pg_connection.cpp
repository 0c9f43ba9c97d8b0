#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>

namespace sqlgate {

namespace {

// libpq messages end with a newline
std::string trimmed(const char* msg) {
    return msg ? std::string(utils::trim(msg)) : std::string{};
}

std::string result_error(PGresult* res, PGconn* conn) {
    std::string msg = res ? trimmed(PQresultErrorMessage(res)) : std::string{};
    if (msg.empty()) {
        msg = trimmed(PQerrorMessage(conn));
    }
    return msg;
}

} // anonymous namespace

// ============================================================================
// PgRowCursor
// ============================================================================

PgRowCursor::PgRowCursor(PGconn* conn, PGresult* first)
    : conn_(conn) {
    take(first);
}

PgRowCursor::~PgRowCursor() {
    if (current_) PQclear(current_);
    if (pending_) PQclear(pending_);
    finish(!done_);
}

void PgRowCursor::take(PGresult* res) {
    if (!res) {
        done_ = true;
        return;
    }

    const ExecStatusType status = PQresultStatus(res);
    if (columns_.empty() && (status == PGRES_SINGLE_TUPLE || status == PGRES_TUPLES_OK)) {
        const int ncols = PQnfields(res);
        columns_.reserve(static_cast<size_t>(ncols));
        for (int i = 0; i < ncols; ++i) {
            columns_.push_back(PgTypeMap::build_type_info(PQfname(res, i), PQftype(res, i)));
        }
    }

    if (status == PGRES_SINGLE_TUPLE) {
        pending_ = res;
        return;
    }

    // End of result set (PGRES_TUPLES_OK), a non-row command, or an error
    if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
        error_ = result_error(res, conn_);
    }
    PQclear(res);
    done_ = true;
}

bool PgRowCursor::next() {
    if (current_) {
        PQclear(current_);
        current_ = nullptr;
    }

    if (!pending_ && !done_) {
        take(PQgetResult(conn_));
    }

    if (!pending_) {
        finish(false);
        return false;
    }

    current_ = pending_;
    pending_ = nullptr;
    decode_binary_fields();
    return true;
}

void PgRowCursor::decode_binary_fields() {
    binary_.assign(columns_.size(), std::nullopt);
    for (size_t i = 0; i < columns_.size(); ++i) {
        const int col = static_cast<int>(i);
        if (columns_[i].generic_type != GenericColumnType::BLOB || PQgetisnull(current_, 0, col)) {
            continue;
        }
        // bytea arrives hex-escaped in text format; hand out the raw bytes
        size_t len = 0;
        unsigned char* raw = PQunescapeBytea(
            reinterpret_cast<const unsigned char*>(PQgetvalue(current_, 0, col)), &len);
        if (raw) {
            binary_[i].emplace(reinterpret_cast<const char*>(raw), len);
            PQfreemem(raw);
        }
    }
}

std::optional<std::string_view> PgRowCursor::field(size_t index) const {
    if (!current_ || index >= columns_.size()) {
        return std::nullopt;
    }
    const int col = static_cast<int>(index);
    if (PQgetisnull(current_, 0, col)) {
        return std::nullopt;
    }
    if (index < binary_.size() && binary_[index]) {
        return std::string_view(*binary_[index]);
    }
    return std::string_view(PQgetvalue(current_, 0, col),
                            static_cast<size_t>(PQgetlength(current_, 0, col)));
}

void PgRowCursor::finish(bool cancel) {
    if (!conn_) {
        return;
    }

    if (cancel) {
        if (PGcancel* handle = PQgetCancel(conn_)) {
            char errbuf[256];
            if (!PQcancel(handle, errbuf, sizeof(errbuf))) {
                utils::log::debug(std::format("PQcancel failed: {}", errbuf));
            }
            PQfreeCancel(handle);
        }
    }

    // The connection is unusable until every result has been consumed
    while (PGresult* res = PQgetResult(conn_)) {
        PQclear(res);
    }
    done_ = true;
    conn_ = nullptr;
}

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbExecResult PgConnection::execute(const std::string& sql) {
    DbExecResult result;

    if (!conn_) {
        result.error_message = "Connection is closed";
        return result;
    }

    PGresult* res = PQexecParams(conn_, sql.c_str(), 0, nullptr, nullptr, nullptr, nullptr, 0);
    if (!res) {
        result.error_message = last_error();
        return result;
    }

    const ExecStatusType status = PQresultStatus(res);
    if (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK) {
        result.success = true;
        result.affected_rows = utils::parse_int<uint64_t>(PQcmdTuples(res), 0);
    } else {
        result.error_message = result_error(res, conn_);
    }

    PQclear(res);
    return result;
}

Result<std::unique_ptr<IRowCursor>> PgConnection::open_cursor(const std::string& sql) {
    using R = Result<std::unique_ptr<IRowCursor>>;

    if (!conn_) {
        return R::error(ErrorCode::EXECUTION_FAILED, "Connection is closed");
    }

    if (!PQsendQueryParams(conn_, sql.c_str(), 0, nullptr, nullptr, nullptr, nullptr, 0)) {
        return R::error(ErrorCode::EXECUTION_FAILED, last_error());
    }

    if (!PQsetSingleRowMode(conn_)) {
        utils::log::debug("PQsetSingleRowMode refused, result will arrive in one piece");
    }

    PGresult* first = PQgetResult(conn_);
    if (first) {
        const ExecStatusType status = PQresultStatus(first);
        if (status == PGRES_FATAL_ERROR || status == PGRES_BAD_RESPONSE ||
            status == PGRES_NONFATAL_ERROR) {
            std::string message = result_error(first, conn_);
            PQclear(first);
            while (PGresult* rest = PQgetResult(conn_)) {
                PQclear(rest);
            }
            return R::error(ErrorCode::EXECUTION_FAILED, std::move(message));
        }
    }

    return R::ok(std::make_unique<PgRowCursor>(conn_, first));
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_) {
        return false;
    }

    if (PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    if (health_check_query.empty()) {
        return true;
    }

    PGresult* res = PQexecParams(conn_, health_check_query.c_str(),
        0, nullptr, nullptr, nullptr, nullptr, 0);
    if (!res) {
        return false;
    }

    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);

    return (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

std::string PgConnection::last_error() const {
    return trimmed(PQerrorMessage(conn_));
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

PgConnectionFactory::PgConnectionFactory(std::chrono::milliseconds connect_timeout)
    : connect_timeout_(connect_timeout) {}

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    // libpq wants whole seconds; 0 would mean wait forever
    const auto seconds = std::max<int64_t>(1, (connect_timeout_.count() + 999) / 1000);
    const std::string timeout = std::to_string(seconds);

    // Later keywords win, so values embedded in the URI override the default
    const char* const keywords[] = {"connect_timeout", "dbname", nullptr};
    const char* const values[] = {timeout.c_str(), connection_string.c_str(), nullptr};

    PGconn* conn = PQconnectdbParams(keywords, values, 1);

    if (!conn) {
        set_last_error("Failed to allocate PGconn");
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        const std::string message = trimmed(PQerrorMessage(conn));
        utils::log::error(std::format("PostgreSQL connection failed: {}", message));
        set_last_error(message);
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

std::string PgConnectionFactory::last_error() const {
    std::lock_guard lock(error_mutex_);
    return last_error_;
}

void PgConnectionFactory::set_last_error(std::string message) {
    std::lock_guard lock(error_mutex_);
    last_error_ = std::move(message);
}

} // namespace sqlgate
