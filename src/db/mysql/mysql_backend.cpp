#include "db/mysql/mysql_backend.hpp"
#include "db/mysql/mysql_connection.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/backend_registry.hpp"

namespace sqlgate {

std::shared_ptr<IConnectionPool> MysqlBackend::create_pool(
    const std::string& name,
    const PoolConfig& config) {

    auto factory = std::make_shared<MysqlConnectionFactory>(config.connection_timeout);
    return std::make_shared<GenericConnectionPool>(name, config, std::move(factory));
}

std::string MysqlBackend::quote_literal(std::string_view value) const {
    // Backslash is an escape character unless NO_BACKSLASH_ESCAPES is set
    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';
    for (const char c : value) {
        switch (c) {
            case '\'': out += "''"; break;
            case '\\': out += "\\\\"; break;
            case '\0': out += "\\0"; break;
            default:   out += c;
        }
    }
    out += '\'';
    return out;
}

std::string MysqlBackend::list_tables_query() const {
    return "SELECT table_name FROM information_schema.tables "
           "WHERE table_schema = DATABASE() ORDER BY table_name";
}

std::string MysqlBackend::table_schema_query(std::string_view table) const {
    return "SELECT column_name AS COLUMN_NAME, data_type AS DATA_TYPE, "
           "is_nullable AS IS_NULLABLE, column_default AS COLUMN_DEFAULT "
           "FROM information_schema.columns "
           "WHERE table_schema = DATABASE() AND table_name = " + quote_literal(table) +
           " ORDER BY ordinal_position";
}

// Auto-register MySQL backend at static initialization
namespace {
    struct MysqlBackendRegistrar {
        MysqlBackendRegistrar() {
            BackendRegistry::instance().register_backend(
                DatabaseType::MYSQL,
                [] { return std::make_unique<MysqlBackend>(); });
        }
    };
    static MysqlBackendRegistrar mysql_registrar;
}

} // namespace sqlgate
