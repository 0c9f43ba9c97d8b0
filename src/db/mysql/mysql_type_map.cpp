#include "db/mysql/mysql_type_map.hpp"

namespace sqlgate {

GenericColumnType MysqlTypeMap::field_type_to_generic(enum_field_types field_type, bool binary) {
    switch (field_type) {
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
            return GenericColumnType::SMALLINT;
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_YEAR:
            return GenericColumnType::INTEGER;
        case MYSQL_TYPE_LONGLONG:
            return GenericColumnType::BIGINT;
        case MYSQL_TYPE_FLOAT:
            return GenericColumnType::REAL;
        case MYSQL_TYPE_DOUBLE:
            return GenericColumnType::DOUBLE_PRECISION;
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL:
            return GenericColumnType::NUMERIC;
        case MYSQL_TYPE_STRING:
            return binary ? GenericColumnType::BLOB : GenericColumnType::CHAR;
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_VARCHAR:
            return binary ? GenericColumnType::BLOB : GenericColumnType::VARCHAR;
        case MYSQL_TYPE_BLOB:
        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
            // TEXT columns report as BLOB with a character collation
            return binary ? GenericColumnType::BLOB : GenericColumnType::TEXT;
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_NEWDATE:
            return GenericColumnType::DATE;
        case MYSQL_TYPE_TIME:
        case MYSQL_TYPE_TIME2:
            return GenericColumnType::TIME;
        case MYSQL_TYPE_DATETIME:
        case MYSQL_TYPE_DATETIME2:
        case MYSQL_TYPE_TIMESTAMP:
        case MYSQL_TYPE_TIMESTAMP2:
            return GenericColumnType::TIMESTAMP;
        case MYSQL_TYPE_JSON:
            return GenericColumnType::JSON;
        case MYSQL_TYPE_ENUM:
        case MYSQL_TYPE_SET:
            return GenericColumnType::VARCHAR;
        case MYSQL_TYPE_BIT:
        case MYSQL_TYPE_GEOMETRY:
            return GenericColumnType::BLOB;
        default:
            return GenericColumnType::UNKNOWN;
    }
}

ColumnTypeInfo MysqlTypeMap::build_type_info(const MYSQL_FIELD& field) {
    const bool binary = field.charsetnr == BINARY_CHARSET_NR;
    return ColumnTypeInfo(
        field.name ? std::string(field.name, field.name_length) : std::string{},
        field_type_to_generic(field.type, binary),
        static_cast<uint32_t>(field.type));
}

} // namespace sqlgate
