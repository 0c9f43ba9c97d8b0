#pragma once

#include "core/column_type.hpp"
#include <cstdint>
#include <string>

namespace sqlgate {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps built-in type OIDs (pg_type.oid) to GenericColumnType.
 */
class PgTypeMap {
public:
    /**
     * @brief Map PostgreSQL OID to GenericColumnType
     * @param oid PostgreSQL type OID
     * @return Generic column type (VENDOR_SPECIFIC for unmapped OIDs)
     */
    [[nodiscard]] static GenericColumnType oid_to_generic_type(uint32_t oid);

    /**
     * @brief Build ColumnTypeInfo for a result column (label from PQfname)
     */
    [[nodiscard]] static ColumnTypeInfo build_type_info(const char* label, uint32_t oid);
};

} // namespace sqlgate
