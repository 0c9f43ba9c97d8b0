#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace sqlgate {

// Forward declarations
class PooledConnection;

/**
 * @brief Pool configuration (database-agnostic)
 *
 * Defaults: 5 connections max, 1 kept warm, 10s acquire, 5min idle, 30min lifetime.
 */
struct PoolConfig {
    std::string connection_string;
    size_t min_connections = 1;
    size_t max_connections = 5;
    std::chrono::milliseconds connection_timeout{10000};
    std::chrono::milliseconds idle_timeout{300000};
    std::chrono::milliseconds max_lifetime{1800000};  // 0 = disabled
    std::string health_check_query{"SELECT 1"};
};

/**
 * @brief Pool statistics for monitoring
 */
struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;
    size_t idle_evictions = 0;
};

/**
 * @brief Abstract connection pool interface
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Acquire connection from pool (blocking with timeout)
     * @param timeout Max wait time for acquisition
     * @return RAII connection handle or nullptr on timeout/error
     */
    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Acquire using the pool's configured connection timeout
     */
    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire() = 0;

    /**
     * @brief Get pool statistics (thread-safe)
     */
    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /**
     * @brief Why the most recent acquire() failed, empty if it never did
     */
    [[nodiscard]] virtual std::string last_error() const = 0;

    /**
     * @brief Periodic maintenance without waiting for an acquire
     *
     * Retires idle connections past idle_timeout (down to min_connections)
     * and idle connections past max_lifetime, then tops the pool back up to
     * min_connections. No-op once drained.
     * @return Number of connections retired
     */
    virtual size_t housekeep() = 0;

    /**
     * @brief Stop handing out connections and close idle ones (idempotent)
     *
     * Connections still checked out are closed when they are returned.
     */
    virtual void drain() = 0;

    [[nodiscard]] virtual bool is_drained() const = 0;

    /**
     * @brief Get the label this pool serves (for logging)
     */
    [[nodiscard]] virtual const std::string& name() const = 0;
};

} // namespace sqlgate
