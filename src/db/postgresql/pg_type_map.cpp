#include "db/postgresql/pg_type_map.hpp"
#include <unordered_map>

namespace sqlgate {

GenericColumnType PgTypeMap::oid_to_generic_type(uint32_t oid) {
    static const std::unordered_map<uint32_t, GenericColumnType> OID_TO_GENERIC = {
        {21, GenericColumnType::SMALLINT},
        {23, GenericColumnType::INTEGER},
        {20, GenericColumnType::BIGINT},
        {26, GenericColumnType::INTEGER},   // oid
        {700, GenericColumnType::REAL},
        {701, GenericColumnType::DOUBLE_PRECISION},
        {1700, GenericColumnType::NUMERIC},
        {25, GenericColumnType::TEXT},
        {19, GenericColumnType::VARCHAR},   // name (information_schema identifiers)
        {1043, GenericColumnType::VARCHAR},
        {1042, GenericColumnType::CHAR},
        {18, GenericColumnType::CHAR},      // "char"
        {16, GenericColumnType::BOOLEAN},
        {1082, GenericColumnType::DATE},
        {1083, GenericColumnType::TIME},
        {1266, GenericColumnType::TIME},
        {1114, GenericColumnType::TIMESTAMP},
        {1184, GenericColumnType::TIMESTAMP_TZ},
        {1186, GenericColumnType::INTERVAL},
        {17, GenericColumnType::BLOB},
        {114, GenericColumnType::JSON},
        {3802, GenericColumnType::JSONB},
        {2950, GenericColumnType::UUID},
        {869, GenericColumnType::INET},
        {650, GenericColumnType::INET},     // cidr
        {790, GenericColumnType::MONEY},
        {142, GenericColumnType::XML},
    };

    auto it = OID_TO_GENERIC.find(oid);
    return it != OID_TO_GENERIC.end() ? it->second : GenericColumnType::VENDOR_SPECIFIC;
}

ColumnTypeInfo PgTypeMap::build_type_info(const char* label, uint32_t oid) {
    return ColumnTypeInfo(label ? label : "", oid_to_generic_type(oid), oid);
}

} // namespace sqlgate
