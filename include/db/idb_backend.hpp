#pragma once

#include "core/database_type.hpp"
#include "core/utils.hpp"
#include "db/iconnection_pool.hpp"
#include <cstdint>
#include <format>
#include <memory>
#include <string>
#include <string_view>

namespace sqlgate {

/**
 * @brief Endpoint coordinates for one dynamic connection
 *
 * params is the raw `k=v&k=v` driver parameter string (already defaulted).
 */
struct EndpointSpec {
    std::string host;
    uint16_t port = 0;
    std::string database;
    std::string user;
    std::string password;
    std::string params;
};

/**
 * @brief Abstract database backend: builds all engine-specific pieces
 *
 * Each database type (PostgreSQL, MySQL) provides a concrete implementation
 * that knows its URL scheme, safe default parameters, catalog statements and
 * how to build a pool.
 *
 * Usage:
 *   auto backend = BackendRegistry::instance().create(DatabaseType::MYSQL);
 *   auto pool = backend->create_pool(handle, config);
 */
class IDbBackend {
public:
    virtual ~IDbBackend() = default;

    /** @brief Database type this backend supports */
    [[nodiscard]] virtual DatabaseType type() const = 0;

    /** @brief Scheme used in canonical and driver URLs */
    [[nodiscard]] virtual std::string_view url_scheme() const = 0;

    /** @brief Parameters applied when the caller supplies none */
    [[nodiscard]] virtual std::string_view default_params() const = 0;

    /** @brief Create a connection pool; config.connection_string is a driver URL */
    [[nodiscard]] virtual std::shared_ptr<IConnectionPool> create_pool(
        const std::string& name,
        const PoolConfig& config) = 0;

    /** @brief Render a value as a string literal in this dialect */
    [[nodiscard]] virtual std::string quote_literal(std::string_view value) const = 0;

    /** @brief Single-column statement listing tables of the current database */
    [[nodiscard]] virtual std::string list_tables_query() const = 0;

    /**
     * @brief Column catalog for one table
     *
     * Columns COLUMN_NAME, DATA_TYPE, IS_NULLABLE, COLUMN_DEFAULT in ordinal order.
     */
    [[nodiscard]] virtual std::string table_schema_query(std::string_view table) const = 0;

    // ===== URL helpers (shared by all engines) =====

    /**
     * @brief Caller-visible URL, never carries credentials
     */
    [[nodiscard]] std::string canonical_url(const EndpointSpec& ep) const {
        auto url = std::format("{}://{}:{}/{}", url_scheme(), url_host(ep.host), ep.port, ep.database);
        if (!ep.params.empty()) {
            url += '?';
            url += ep.params;
        }
        return url;
    }

    /**
     * @brief Driver URL with percent-encoded credentials
     */
    [[nodiscard]] std::string connection_uri(const EndpointSpec& ep) const {
        std::string userinfo;
        if (!ep.user.empty()) {
            userinfo = utils::url_encode(ep.user);
            if (!ep.password.empty()) {
                userinfo += ':';
                userinfo += utils::url_encode(ep.password);
            }
            userinfo += '@';
        }
        auto uri = std::format("{}://{}{}:{}/{}", url_scheme(), userinfo, url_host(ep.host), ep.port,
            utils::url_encode(ep.database));
        if (!ep.params.empty()) {
            uri += '?';
            uri += ep.params;
        }
        return uri;
    }

private:
    // IPv6 literals are bracketed so the port separator stays unambiguous
    static std::string url_host(const std::string& host) {
        if (host.find(':') == std::string::npos) return host;
        return std::format("[{}]", host);
    }
};

} // namespace sqlgate
