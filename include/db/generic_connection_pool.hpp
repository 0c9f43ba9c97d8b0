#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlgate {

/**
 * @brief Database-agnostic connection pool
 *
 * Works with any IDbConnection via IConnectionFactory.
 *
 * Design:
 * - Bounded pool: max_connections enforced via counting_semaphore (C++20)
 * - Warm floor: min_connections opened eagerly, idle ones beyond the floor
 *   are retired once they exceed idle_timeout
 * - Max lifetime: connections older than max_lifetime are replaced on acquire
 * - Housekeeping: housekeep() applies both limits to connections nobody
 *   acquires, so a quiet pool shrinks back to its floor
 * - Health checking: a connection that sat idle past idle_timeout is health-checked
 *   before being handed out
 * - Thread-safe: mutex protects deque and bookkeeping maps, semaphore
 *   prevents oversubscription
 * - RAII: PooledConnection auto-returns on destruction
 */
class GenericConnectionPool : public IConnectionPool {
public:
    /**
     * @brief Construct pool with connection factory
     * @param name Label used in log lines
     * @param config Pool configuration
     * @param factory Connection factory (creates IDbConnection instances)
     */
    GenericConnectionPool(
        std::string name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    std::unique_ptr<PooledConnection> acquire(std::chrono::milliseconds timeout) override;

    std::unique_ptr<PooledConnection> acquire() override {
        return acquire(config_.connection_timeout);
    }

    PoolStats get_stats() const override;

    std::string last_error() const override;

    size_t housekeep() override;

    void drain() override;

    bool is_drained() const override { return shutdown_.load(std::memory_order_acquire); }

    const std::string& name() const override { return name_; }

private:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Create new connection via factory and start tracking it
     */
    std::unique_ptr<IDbConnection> create_connection();

    /**
     * @brief Stop tracking and close a connection
     */
    void destroy_connection(std::unique_ptr<IDbConnection> conn);

    /**
     * @brief Detach idle connections past idle_timeout while above the floor
     *
     * Caller holds mutex_. Returned connections are closed outside the lock.
     */
    std::vector<std::unique_ptr<IDbConnection>> take_expired_idle_locked(Clock::time_point now);

    /**
     * @brief Detach idle connections older than max_lifetime (caller holds mutex_)
     */
    std::vector<std::unique_ptr<IDbConnection>> take_aged_idle_locked(Clock::time_point now);

    /**
     * @brief Return connection to pool (called by PooledConnection destructor)
     */
    void return_connection(std::unique_ptr<IDbConnection> conn, bool broken);

    void set_last_error(std::string message);

    std::string name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    // Connection storage
    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    mutable std::mutex mutex_;

    // Semaphore for bounded pool (C++20)
    std::counting_semaphore<> semaphore_;

    // Statistics (atomic for lock-free reads)
    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};
    std::atomic<size_t> idle_evictions_{0};

    // Shutdown flag
    std::atomic<bool> shutdown_{false};

    // Connection lifetime tracking (guarded by mutex_)
    std::unordered_map<IDbConnection*, Clock::time_point> created_at_;
    std::unordered_map<IDbConnection*, Clock::time_point> last_used_;

    mutable std::mutex error_mutex_;
    std::string last_error_;
};

} // namespace sqlgate
