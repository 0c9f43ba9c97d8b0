#include "db/postgresql/pg_backend.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/backend_registry.hpp"

namespace sqlgate {

std::shared_ptr<IConnectionPool> PgBackend::create_pool(
    const std::string& name,
    const PoolConfig& config) {

    auto factory = std::make_shared<PgConnectionFactory>(config.connection_timeout);
    return std::make_shared<GenericConnectionPool>(name, config, std::move(factory));
}

std::string PgBackend::quote_literal(std::string_view value) const {
    // standard_conforming_strings is on by default: only quotes need doubling
    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';
    for (const char c : value) {
        if (c == '\'') out += '\'';
        if (c != '\0') out += c;
    }
    out += '\'';
    return out;
}

std::string PgBackend::list_tables_query() const {
    return "SELECT table_name FROM information_schema.tables "
           "WHERE table_schema = current_schema() ORDER BY table_name";
}

std::string PgBackend::table_schema_query(std::string_view table) const {
    return "SELECT column_name AS \"COLUMN_NAME\", data_type AS \"DATA_TYPE\", "
           "is_nullable AS \"IS_NULLABLE\", column_default AS \"COLUMN_DEFAULT\" "
           "FROM information_schema.columns "
           "WHERE table_schema = current_schema() AND table_name = " + quote_literal(table) +
           " ORDER BY ordinal_position";
}

// Auto-register PostgreSQL backend at static initialization
namespace {
    struct PgBackendRegistrar {
        PgBackendRegistrar() {
            BackendRegistry::instance().register_backend(
                DatabaseType::POSTGRESQL,
                [] { return std::make_unique<PgBackend>(); });
        }
    };
    static PgBackendRegistrar pg_registrar;
}

} // namespace sqlgate
