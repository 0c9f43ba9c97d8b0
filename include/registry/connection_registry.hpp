#pragma once

#include "core/database_type.hpp"
#include "core/error.hpp"
#include "db/idb_backend.hpp"
#include "db/iconnection_pool.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace sqlgate {

/**
 * @brief Per-connection pool timing knobs
 */
struct TimeoutPolicy {
    // Upper bound for every timeout (about 24.8 days); larger values overflow
    // the nanosecond clocks the pool waits on
    static constexpr int64_t MAX_TIMEOUT_MS = std::numeric_limits<int32_t>::max();

    std::chrono::milliseconds connection_timeout{10000};
    std::chrono::milliseconds idle_timeout{300000};
    std::chrono::milliseconds max_lifetime{1800000};
};

/**
 * @brief Arguments of a create call as received from the caller
 *
 * Mandatory coordinates are optional here so that absence can be reported
 * as INVALID_ARGUMENT instead of being defaulted. Timeout overrides are
 * milliseconds; unset ones fall back to the registry defaults.
 */
struct ConnectionRequest {
    std::optional<std::string> host;
    std::optional<int64_t> port;
    std::optional<std::string> database;
    std::string user;
    std::string password;
    std::optional<std::string> params;
    DatabaseType type = DatabaseType::MYSQL;

    std::optional<int64_t> connection_timeout_ms;
    std::optional<int64_t> idle_timeout_ms;
    std::optional<int64_t> max_lifetime_ms;
};

/**
 * @brief Caller-visible description of a live handle
 */
struct ConnectionInfo {
    std::string handle;
    std::string url;
};

/**
 * @brief One live handle: its pool plus the backend that built it
 *
 * Shared with in-flight operations, so a concurrent close() never frees
 * a pool that is still executing a statement.
 */
struct ManagedConnection {
    std::string handle;
    std::string url;
    uint64_t sequence = 0;
    DatabaseType type = DatabaseType::MYSQL;
    std::shared_ptr<IDbBackend> backend;
    std::shared_ptr<IConnectionPool> pool;
    TimeoutPolicy timeouts;
    std::chrono::system_clock::time_point created_at;
};

/**
 * @brief Dynamic connection registry
 *
 * Maps opaque handles (UUID v4) to validated connection pools. Handles
 * move absent → live → closed; a closed handle is never revived.
 *
 * Thread-safety: the map sits behind a shared_mutex. Lookups take it
 * shared, insert/erase take it exclusive, and no database I/O (pool
 * creation, validation, drain) happens while it is held.
 *
 * A housekeeper thread calls IConnectionPool::housekeep() on every live
 * pool each housekeeping_interval, so idle and aged connections are
 * retired even on handles nobody uses. close_all() stops it.
 */
class ConnectionRegistry {
public:
    struct Config {
        size_t max_connections = 5;
        size_t min_idle = 1;
        std::string validation_query = "SELECT 1";
        TimeoutPolicy default_timeouts{};
        std::chrono::milliseconds housekeeping_interval{30000};  // 0 = disabled
    };

    using BackendProvider = std::function<std::shared_ptr<IDbBackend>(DatabaseType)>;

    ConnectionRegistry();
    explicit ConnectionRegistry(Config config);

    /**
     * @brief Registry with a custom backend source (tests inject mocks here)
     */
    ConnectionRegistry(Config config, BackendProvider provider);

    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /**
     * @brief Build, validate and register a pool
     *
     * Errors: INVALID_ARGUMENT (missing/invalid coordinates or timeouts,
     * engine not available), CONNECTION_UNAVAILABLE (validation query failed;
     * nothing is registered).
     */
    [[nodiscard]] Result<ConnectionInfo> create(const ConnectionRequest& request);

    /**
     * @brief Look up a live handle, UNKNOWN_HANDLE if absent or closed
     */
    [[nodiscard]] Result<std::shared_ptr<ManagedConnection>> get(const std::string& handle) const;

    /**
     * @brief Snapshot of live handles in creation order
     */
    [[nodiscard]] std::vector<ConnectionInfo> list() const;

    /**
     * @brief Remove a handle and drain its pool
     * @return true exactly once per created handle
     */
    bool close(const std::string& handle);

    /**
     * @brief Stop housekeeping and drain every pool (shutdown).
     * Safe to call repeatedly.
     * @return Number of handles closed
     */
    size_t close_all();

    /**
     * @brief One housekeeping pass over every live pool
     * @return Connections retired across all pools
     */
    size_t housekeep();

    [[nodiscard]] size_t size() const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    [[nodiscard]] Result<TimeoutPolicy> resolve_timeouts(const ConnectionRequest& request) const;

    void housekeeping_loop();
    void stop_housekeeper();

    Config config_;
    BackendProvider backend_provider_;
    std::unordered_map<std::string, std::shared_ptr<ManagedConnection>> connections_;
    mutable std::shared_mutex mutex_;
    std::atomic<uint64_t> next_sequence_{1};

    // Housekeeper (declared last: joined before the members above go away)
    std::atomic<bool> shutdown_{false};
    std::mutex shutdown_mutex_;
    std::condition_variable shutdown_cv_;
    std::jthread housekeeper_;
};

/**
 * @brief close_all() on a helper thread, giving up after timeout
 *
 * The helper keeps the registry alive until it finishes, so an endpoint
 * that hangs on disconnect cannot block shutdown.
 * @return Handles closed, or nullopt when the timeout elapsed first
 */
[[nodiscard]] std::optional<size_t> close_all_within(
    std::shared_ptr<ConnectionRegistry> registry, std::chrono::milliseconds timeout);

} // namespace sqlgate
