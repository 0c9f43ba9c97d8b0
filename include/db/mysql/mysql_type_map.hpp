#pragma once

#include "core/column_type.hpp"
#include <mysql/mysql.h>
#include <cstdint>

namespace sqlgate {

/**
 * @brief MySQL type mapping utilities
 *
 * Maps MySQL field metadata to GenericColumnType. The field type alone
 * cannot tell TEXT from BLOB or VARCHAR from VARBINARY; the binary
 * collation (charsetnr 63) decides.
 */
class MysqlTypeMap {
public:
    static constexpr unsigned int BINARY_CHARSET_NR = 63;

    /**
     * @brief Map MySQL field type to GenericColumnType
     * @param field_type MySQL enum_field_types value
     * @param binary true when the column uses the binary character set
     */
    [[nodiscard]] static GenericColumnType field_type_to_generic(
        enum_field_types field_type, bool binary);

    /**
     * @brief Build ColumnTypeInfo (label, generic type, field type id) for a result column
     */
    [[nodiscard]] static ColumnTypeInfo build_type_info(const MYSQL_FIELD& field);
};

} // namespace sqlgate
