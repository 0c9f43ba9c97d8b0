#pragma once

#include "db/idb_backend.hpp"

namespace sqlgate {

/**
 * @brief MySQL/MariaDB backend
 *
 * Creates MysqlConnectionFactory → GenericConnectionPool and supplies
 * the information_schema statements scoped to DATABASE().
 *
 * Auto-registers with BackendRegistry at static init time.
 */
class MysqlBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::MYSQL;
    }

    [[nodiscard]] std::string_view url_scheme() const override { return "mysql"; }

    [[nodiscard]] std::string_view default_params() const override {
        return "useSSL=false&serverTimezone=UTC&characterEncoding=utf8";
    }

    [[nodiscard]] std::shared_ptr<IConnectionPool> create_pool(
        const std::string& name,
        const PoolConfig& config) override;

    [[nodiscard]] std::string quote_literal(std::string_view value) const override;

    [[nodiscard]] std::string list_tables_query() const override;

    [[nodiscard]] std::string table_schema_query(std::string_view table) const override;
};

} // namespace sqlgate
