#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>

namespace sqlgate {

GenericConnectionPool::GenericConnectionPool(
    std::string name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : name_(std::move(name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    // Pre-warm pool with min_connections
    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto conn = create_connection();
        if (!conn) {
            utils::log::warn(std::format("Failed to create connection {} during pool initialization for '{}': {}",
                i + 1, name_, last_error()));
            break;
        }
        std::lock_guard lock(mutex_);
        idle_connections_.emplace_back(std::move(conn));
    }

    utils::log::debug(std::format("ConnectionPool initialized for '{}': {} connections (min={}, max={})",
        name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    if (shutdown_.load(std::memory_order_acquire)) {
        set_last_error("Connection pool is closed");
        return nullptr;
    }

    // Acquire semaphore slot (blocks if pool full)
    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        set_last_error(std::format("Timed out after {}ms waiting for a connection", timeout.count()));
        return nullptr;
    }

    // Re-check shutdown after acquiring semaphore (drain may have run in between)
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        set_last_error("Connection pool is closed");
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    Clock::time_point birth{};
    Clock::time_point last_used{};
    std::vector<std::unique_ptr<IDbConnection>> expired;

    // Try to get connection from idle pool (single lock)
    {
        std::lock_guard lock(mutex_);
        expired = take_expired_idle_locked(Clock::now());
        if (!idle_connections_.empty()) {
            // Most recently returned first: keeps the warm set small
            conn = std::move(idle_connections_.back());
            idle_connections_.pop_back();
            birth = created_at_[conn.get()];
            last_used = last_used_[conn.get()];
        }
    }
    for (auto& e : expired) {
        idle_evictions_.fetch_add(1, std::memory_order_relaxed);
        destroy_connection(std::move(e));
    }

    const auto now = Clock::now();

    // Check max_lifetime: recycle if connection is too old
    if (conn && config_.max_lifetime.count() > 0 && now - birth > config_.max_lifetime) {
        destroy_connection(std::move(conn));
        connections_recycled_.fetch_add(1, std::memory_order_relaxed);
    }

    // Only health-check connections that sat idle longer than idle_timeout.
    // Recently-used connections skip the round trip.
    if (conn && now - last_used > config_.idle_timeout) {
        if (!conn->is_healthy(config_.health_check_query)) {
            health_check_failures_.fetch_add(1, std::memory_order_relaxed);
            destroy_connection(std::move(conn));
        }
    }

    // If no usable idle connection, create a new one
    if (!conn) {
        conn = create_connection();
        if (!conn) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
    }

    auto return_fn = [this](std::unique_ptr<IDbConnection> c, bool broken) {
        this->return_connection(std::move(c), broken);
    };

    return std::make_unique<PooledConnection>(std::move(conn), return_fn);
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections >= stats.idle_connections
        ? stats.total_connections - stats.idle_connections : 0;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    stats.idle_evictions = idle_evictions_.load(std::memory_order_relaxed);
    return stats;
}

std::string GenericConnectionPool::last_error() const {
    std::lock_guard lock(error_mutex_);
    return last_error_;
}

size_t GenericConnectionPool::housekeep() {
    if (shutdown_.load(std::memory_order_acquire)) {
        return 0;
    }

    std::vector<std::unique_ptr<IDbConnection>> expired;
    std::vector<std::unique_ptr<IDbConnection>> aged;
    {
        std::lock_guard lock(mutex_);
        const auto now = Clock::now();
        expired = take_expired_idle_locked(now);
        aged = take_aged_idle_locked(now);
    }

    for (auto& e : expired) {
        idle_evictions_.fetch_add(1, std::memory_order_relaxed);
        destroy_connection(std::move(e));
    }
    for (auto& a : aged) {
        connections_recycled_.fetch_add(1, std::memory_order_relaxed);
        destroy_connection(std::move(a));
    }
    const size_t retired = expired.size() + aged.size();

    // Refill the warm floor; a failed connect waits for the next pass
    size_t created = 0;
    while (total_connections_.load(std::memory_order_relaxed) <
           std::min(config_.min_connections, config_.max_connections)) {
        auto conn = create_connection();
        if (!conn) {
            utils::log::debug(std::format("Housekeeping could not refill '{}': {}", name_, last_error()));
            break;
        }
        {
            std::lock_guard lock(mutex_);
            if (!shutdown_.load(std::memory_order_acquire)) {
                idle_connections_.emplace_back(std::move(conn));
            }
        }
        if (conn) {
            destroy_connection(std::move(conn));
            break;
        }
        ++created;
    }

    if (retired > 0 || created > 0) {
        utils::log::debug(std::format("Housekeeping '{}': {} retired, {} opened, {} total",
            name_, retired, created, total_connections_.load(std::memory_order_relaxed)));
    }
    return retired;
}

void GenericConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::deque<std::unique_ptr<IDbConnection>> idle;
    {
        std::lock_guard lock(mutex_);
        idle.swap(idle_connections_);
    }

    for (auto& conn : idle) {
        destroy_connection(std::move(conn));
    }

    utils::log::debug(std::format("ConnectionPool drained for '{}' ({} closed)", name_, idle.size()));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (!conn) {
        const auto reason = factory_->last_error();
        set_last_error(reason.empty() ? std::string("connection refused") : reason);
        return nullptr;
    }

    total_connections_.fetch_add(1, std::memory_order_relaxed);
    const auto now = Clock::now();
    std::lock_guard lock(mutex_);
    created_at_[conn.get()] = now;
    last_used_[conn.get()] = now;
    return conn;
}

void GenericConnectionPool::destroy_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }
    {
        std::lock_guard lock(mutex_);
        created_at_.erase(conn.get());
        last_used_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

std::vector<std::unique_ptr<IDbConnection>> GenericConnectionPool::take_expired_idle_locked(
    Clock::time_point now) {

    std::vector<std::unique_ptr<IDbConnection>> expired;
    if (config_.idle_timeout.count() <= 0) {
        return expired;
    }

    // Oldest returns sit at the front
    size_t remaining = total_connections_.load(std::memory_order_relaxed);
    while (!idle_connections_.empty() && remaining > config_.min_connections) {
        auto* front = idle_connections_.front().get();
        const auto it = last_used_.find(front);
        if (it == last_used_.end() || now - it->second <= config_.idle_timeout) {
            break;
        }
        expired.emplace_back(std::move(idle_connections_.front()));
        idle_connections_.pop_front();
        --remaining;
    }
    return expired;
}

std::vector<std::unique_ptr<IDbConnection>> GenericConnectionPool::take_aged_idle_locked(
    Clock::time_point now) {

    std::vector<std::unique_ptr<IDbConnection>> aged;
    if (config_.max_lifetime.count() <= 0) {
        return aged;
    }

    for (auto it = idle_connections_.begin(); it != idle_connections_.end();) {
        const auto born = created_at_.find(it->get());
        if (born != created_at_.end() && now - born->second > config_.max_lifetime) {
            aged.emplace_back(std::move(*it));
            it = idle_connections_.erase(it);
        } else {
            ++it;
        }
    }
    return aged;
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn, bool broken) {
    if (!conn) {
        semaphore_.release();
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    std::vector<std::unique_ptr<IDbConnection>> expired;
    {
        // Shutdown is checked under the lock so drain() cannot miss a late return
        std::lock_guard lock(mutex_);
        if (!broken && !shutdown_.load(std::memory_order_acquire)) {
            last_used_[conn.get()] = Clock::now();
            idle_connections_.emplace_back(std::move(conn));
            expired = take_expired_idle_locked(Clock::now());
        }
    }

    // If shutdown or broken, close immediately
    if (conn) {
        destroy_connection(std::move(conn));
    }
    for (auto& e : expired) {
        idle_evictions_.fetch_add(1, std::memory_order_relaxed);
        destroy_connection(std::move(e));
    }

    semaphore_.release();
}

void GenericConnectionPool::set_last_error(std::string message) {
    std::lock_guard lock(error_mutex_);
    last_error_ = std::move(message);
}

} // namespace sqlgate
