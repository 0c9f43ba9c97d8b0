#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace sqlgate {

/**
 * @brief Database-agnostic column type classification
 *
 * Maps from vendor-specific types (PG OIDs, MySQL field types).
 * Drives field truncation and JSON rendering of result cells.
 */
enum class GenericColumnType : uint16_t {
    UNKNOWN = 0,

    // Integer family
    SMALLINT,
    INTEGER,
    BIGINT,

    // Floating point
    REAL,
    DOUBLE_PRECISION,
    NUMERIC,

    // String family
    TEXT,
    VARCHAR,
    CHAR,

    // Boolean
    BOOLEAN,

    // Date/Time
    DATE,
    TIME,
    TIMESTAMP,
    TIMESTAMP_TZ,
    INTERVAL,

    // Binary
    BLOB,

    // JSON
    JSON,
    JSONB,

    // UUID
    UUID,

    // Network
    INET,

    // Monetary
    MONEY,

    // XML
    XML,

    // Vendor-specific fallback
    VENDOR_SPECIFIC,
};

/**
 * @brief Extended column type info carrying both generic and vendor-specific data
 */
struct ColumnTypeInfo {
    std::string label;                 // driver-reported column label (alias)
    GenericColumnType generic_type = GenericColumnType::UNKNOWN;
    uint32_t vendor_type_id = 0;       // PG OID or MySQL field type enum

    ColumnTypeInfo() = default;
    ColumnTypeInfo(std::string l, GenericColumnType gt, uint32_t vid)
        : label(std::move(l)), generic_type(gt), vendor_type_id(vid) {}
};

/**
 * @brief Character data subject to the field-length cap
 */
[[nodiscard]] inline constexpr bool is_textual(GenericColumnType type) noexcept {
    switch (type) {
        case GenericColumnType::TEXT:
        case GenericColumnType::VARCHAR:
        case GenericColumnType::CHAR:
        case GenericColumnType::JSON:
        case GenericColumnType::JSONB:
        case GenericColumnType::XML:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] inline constexpr bool is_numeric(GenericColumnType type) noexcept {
    switch (type) {
        case GenericColumnType::SMALLINT:
        case GenericColumnType::INTEGER:
        case GenericColumnType::BIGINT:
        case GenericColumnType::REAL:
        case GenericColumnType::DOUBLE_PRECISION:
        case GenericColumnType::NUMERIC:
            return true;
        default:
            return false;
    }
}

} // namespace sqlgate
