#pragma once

#include "db/idb_backend.hpp"

namespace sqlgate {

/**
 * @brief PostgreSQL backend
 *
 * Creates PgConnectionFactory → GenericConnectionPool and supplies the
 * information_schema statements scoped to current_schema().
 *
 * Auto-registers with BackendRegistry at static init time.
 */
class PgBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::POSTGRESQL;
    }

    [[nodiscard]] std::string_view url_scheme() const override { return "postgresql"; }

    [[nodiscard]] std::string_view default_params() const override {
        return "sslmode=disable&client_encoding=UTF8&options=-c%20TimeZone%3DUTC";
    }

    [[nodiscard]] std::shared_ptr<IConnectionPool> create_pool(
        const std::string& name,
        const PoolConfig& config) override;

    [[nodiscard]] std::string quote_literal(std::string_view value) const override;

    [[nodiscard]] std::string list_tables_query() const override;

    [[nodiscard]] std::string table_schema_query(std::string_view table) const override;
};

} // namespace sqlgate
