#pragma once

#include "core/column_type.hpp"
#include "core/error.hpp"
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlgate {

struct ManagedConnection;

/**
 * @brief One result cell: driver text rendering (nullopt for NULL) plus its type
 */
struct FieldValue {
    GenericColumnType type = GenericColumnType::UNKNOWN;
    std::optional<std::string> data;
};

struct NamedField {
    std::string label;
    FieldValue value;
};

/**
 * @brief Row as an ordered label → value sequence (result column order)
 */
using ResultRow = std::vector<NamedField>;

/**
 * @brief Read-path executor that bounds what a SELECT can return
 *
 * - Only statements whose trimmed form starts with "select" are accepted,
 *   checked before any connection is touched
 * - Row cap is applied while streaming: the cursor is advanced at most
 *   max_query_rows times and then abandoned
 * - Textual values longer than max_field_length code points are cut and
 *   suffixed with "...(truncated,len=L)"
 *
 * Limits are atomics; a change applies to queries started afterwards.
 */
class ResultShaper {
public:
    static constexpr int64_t DEFAULT_MAX_QUERY_ROWS = 200;
    static constexpr int64_t DEFAULT_MAX_FIELD_LENGTH = 256;

    struct Config {
        int64_t max_query_rows = DEFAULT_MAX_QUERY_ROWS;
        int64_t max_field_length = DEFAULT_MAX_FIELD_LENGTH;
    };

    ResultShaper() : ResultShaper(Config{}) {}
    explicit ResultShaper(const Config& config);

    [[nodiscard]] static bool is_read_statement(std::string_view statement);

    /**
     * @brief Run a read statement on a pooled connection of the handle
     *
     * Errors: STATEMENT_NOT_ALLOWED, EXECUTION_FAILED ("Query failed: ...").
     */
    [[nodiscard]] Result<std::vector<ResultRow>> query(
        ManagedConnection& conn, const std::string& statement) const;

    /**
     * @brief Set the row cap
     * @return Previous value, or INVALID_ARGUMENT for rows <= 0
     */
    Result<int64_t> set_max_query_rows(int64_t rows);

    /**
     * @brief Set the text field cap
     * @return Previous value, or INVALID_ARGUMENT for length <= 0
     */
    Result<int64_t> set_max_field_length(int64_t length);

    [[nodiscard]] int64_t max_query_rows() const {
        return max_query_rows_.load(std::memory_order_acquire);
    }

    [[nodiscard]] int64_t max_field_length() const {
        return max_field_length_.load(std::memory_order_acquire);
    }

    /**
     * @brief Cut value to max_chars code points plus the length marker
     *
     * Values within the cap are returned unchanged.
     */
    [[nodiscard]] static std::string truncate_field(std::string_view value, size_t max_chars);

private:
    std::atomic<int64_t> max_query_rows_;
    std::atomic<int64_t> max_field_length_;
};

} // namespace sqlgate
