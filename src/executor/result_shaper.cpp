#include "executor/result_shaper.hpp"
#include "core/utils.hpp"
#include "db/pooled_connection.hpp"
#include "registry/connection_registry.hpp"

#include <format>

namespace sqlgate {

ResultShaper::ResultShaper(const Config& config)
    : max_query_rows_(config.max_query_rows > 0 ? config.max_query_rows : DEFAULT_MAX_QUERY_ROWS),
      max_field_length_(config.max_field_length > 0 ? config.max_field_length : DEFAULT_MAX_FIELD_LENGTH) {}

bool ResultShaper::is_read_statement(std::string_view statement) {
    return utils::starts_with_icase(utils::trim(statement), "select");
}

Result<std::vector<ResultRow>> ResultShaper::query(
    ManagedConnection& conn, const std::string& statement) const {

    using R = Result<std::vector<ResultRow>>;

    if (!is_read_statement(statement)) {
        utils::log::warn(std::format("Rejected non-read statement on {}", conn.handle));
        return R::error(ErrorCode::STATEMENT_NOT_ALLOWED, "Only SELECT statements allowed.");
    }

    // Limits are sampled once so a concurrent change cannot split a result
    const auto row_cap = static_cast<size_t>(max_query_rows());
    const auto field_cap = static_cast<size_t>(max_field_length());

    utils::Timer timer;

    auto pooled = conn.pool->acquire(conn.timeouts.connection_timeout);
    if (!pooled) {
        return R::error(ErrorCode::EXECUTION_FAILED,
            std::format("Query failed: {}", conn.pool->last_error()));
    }

    auto opened = (*pooled)->open_cursor(statement);
    if (opened.is_error()) {
        return R::error(ErrorCode::EXECUTION_FAILED,
            std::format("Query failed: {}", opened.error_message()));
    }
    // Declared after pooled: released before the connection goes back
    auto cursor = std::move(opened.value());

    const auto& columns = cursor->columns();
    std::vector<ResultRow> rows;

    while (rows.size() < row_cap && cursor->next()) {
        ResultRow row;
        row.reserve(columns.size());
        for (size_t i = 0; i < columns.size(); ++i) {
            NamedField field;
            field.label = columns[i].label;
            field.value.type = columns[i].generic_type;
            if (const auto raw = cursor->field(i)) {
                field.value.data = is_textual(columns[i].generic_type)
                    ? truncate_field(*raw, field_cap)
                    : std::string(*raw);
            }
            row.push_back(std::move(field));
        }
        rows.push_back(std::move(row));
    }

    if (!cursor->error().empty()) {
        return R::error(ErrorCode::EXECUTION_FAILED,
            std::format("Query failed: {}", cursor->error()));
    }

    utils::log::debug(std::format("Query on {} returned {} row(s) in {}ms",
        conn.handle, rows.size(), timer.elapsed_ms().count()));
    return R::ok(std::move(rows));
}

Result<int64_t> ResultShaper::set_max_query_rows(int64_t rows) {
    if (rows <= 0) {
        return Result<int64_t>::error(ErrorCode::INVALID_ARGUMENT, "rows must be > 0");
    }
    const auto previous = max_query_rows_.exchange(rows, std::memory_order_acq_rel);
    utils::log::info(std::format("maxQueryRows: {} -> {}", previous, rows));
    return Result<int64_t>::ok(previous);
}

Result<int64_t> ResultShaper::set_max_field_length(int64_t length) {
    if (length <= 0) {
        return Result<int64_t>::error(ErrorCode::INVALID_ARGUMENT, "length must be > 0");
    }
    const auto previous = max_field_length_.exchange(length, std::memory_order_acq_rel);
    utils::log::info(std::format("maxFieldLength: {} -> {}", previous, length));
    return Result<int64_t>::ok(previous);
}

std::string ResultShaper::truncate_field(std::string_view value, size_t max_chars) {
    const size_t length = utils::utf8_length(value);
    if (length <= max_chars) {
        return std::string(value);
    }
    std::string out(value.substr(0, utils::utf8_prefix_bytes(value, max_chars)));
    out += std::format("...(truncated,len={})", length);
    return out;
}

} // namespace sqlgate
