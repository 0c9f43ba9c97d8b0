#include "registry/connection_registry.hpp"
#include "core/utils.hpp"
#include "db/backend_registry.hpp"
#include "db/pooled_connection.hpp"

#include <algorithm>
#include <format>
#include <future>
#include <mutex>
#include <thread>

namespace sqlgate {

namespace {

std::shared_ptr<IDbBackend> backend_from_registry(DatabaseType type) {
    if (!BackendRegistry::instance().has_backend(type)) {
        return nullptr;
    }
    return BackendRegistry::instance().create(type);
}

} // anonymous namespace

ConnectionRegistry::ConnectionRegistry() : ConnectionRegistry(Config{}) {}

ConnectionRegistry::ConnectionRegistry(Config config)
    : ConnectionRegistry(std::move(config), backend_from_registry) {}

ConnectionRegistry::ConnectionRegistry(Config config, BackendProvider provider)
    : config_(std::move(config)),
      backend_provider_(std::move(provider)) {
    if (config_.housekeeping_interval.count() > 0) {
        housekeeper_ = std::jthread([this] { housekeeping_loop(); });
    }
}

ConnectionRegistry::~ConnectionRegistry() {
    close_all();
}

void ConnectionRegistry::housekeeping_loop() {
    utils::log::debug(std::format("Pool housekeeper started (interval {}ms)",
        config_.housekeeping_interval.count()));

    while (!shutdown_.load(std::memory_order_acquire)) {
        {
            std::unique_lock lock(shutdown_mutex_);
            shutdown_cv_.wait_for(lock, config_.housekeeping_interval, [this] {
                return shutdown_.load(std::memory_order_acquire);
            });
        }
        if (shutdown_.load(std::memory_order_acquire)) {
            break;
        }
        housekeep();
    }
}

void ConnectionRegistry::stop_housekeeper() {
    {
        std::lock_guard lock(shutdown_mutex_);
        shutdown_.store(true, std::memory_order_release);
    }
    shutdown_cv_.notify_all();
    if (housekeeper_.joinable()) {
        housekeeper_.join();
    }
}

size_t ConnectionRegistry::housekeep() {
    std::vector<std::shared_ptr<ManagedConnection>> snapshot;
    {
        std::shared_lock lock(mutex_);
        snapshot.reserve(connections_.size());
        for (const auto& [_, managed] : connections_) {
            snapshot.push_back(managed);
        }
    }

    size_t retired = 0;
    for (const auto& managed : snapshot) {
        retired += managed->pool->housekeep();
    }
    if (retired > 0) {
        utils::log::debug(std::format("Housekeeping retired {} connection(s)", retired));
    }
    return retired;
}

Result<TimeoutPolicy> ConnectionRegistry::resolve_timeouts(const ConnectionRequest& request) const {
    TimeoutPolicy policy = config_.default_timeouts;

    const auto apply = [](const std::optional<int64_t>& override_ms,
                          std::chrono::milliseconds& target,
                          const char* name) -> std::optional<std::string> {
        if (!override_ms) return std::nullopt;
        if (*override_ms <= 0 || *override_ms > TimeoutPolicy::MAX_TIMEOUT_MS) {
            return std::format("{} must be between 1 and {} ms, got {}",
                name, TimeoutPolicy::MAX_TIMEOUT_MS, *override_ms);
        }
        target = std::chrono::milliseconds{*override_ms};
        return std::nullopt;
    };

    if (auto err = apply(request.connection_timeout_ms, policy.connection_timeout, "connectionTimeout")) {
        return Result<TimeoutPolicy>::error(ErrorCode::INVALID_ARGUMENT, *err);
    }
    if (auto err = apply(request.idle_timeout_ms, policy.idle_timeout, "idleTimeout")) {
        return Result<TimeoutPolicy>::error(ErrorCode::INVALID_ARGUMENT, *err);
    }
    if (auto err = apply(request.max_lifetime_ms, policy.max_lifetime, "maxLifetime")) {
        return Result<TimeoutPolicy>::error(ErrorCode::INVALID_ARGUMENT, *err);
    }
    return Result<TimeoutPolicy>::ok(policy);
}

Result<ConnectionInfo> ConnectionRegistry::create(const ConnectionRequest& request) {
    using R = Result<ConnectionInfo>;

    // 1. Mandatory coordinates
    if (!request.host || utils::trim(*request.host).empty()) {
        return R::error(ErrorCode::INVALID_ARGUMENT, "host is required");
    }
    if (!request.port) {
        return R::error(ErrorCode::INVALID_ARGUMENT, "port is required");
    }
    if (!utils::in_range<1, 65535>(*request.port)) {
        return R::error(ErrorCode::INVALID_ARGUMENT,
            std::format("port must be between 1 and 65535, got {}", *request.port));
    }
    if (!request.database || utils::trim(*request.database).empty()) {
        return R::error(ErrorCode::INVALID_ARGUMENT, "database is required");
    }

    auto timeouts = resolve_timeouts(request);
    if (timeouts.is_error()) {
        return R::propagate(timeouts);
    }

    // 2. Engine
    std::shared_ptr<IDbBackend> backend = backend_provider_ ? backend_provider_(request.type) : nullptr;
    if (!backend) {
        return R::error(ErrorCode::INVALID_ARGUMENT,
            std::format("Database type '{}' is not available in this build",
                database_type_to_string(request.type)));
    }

    // 3. Endpoint and pool
    EndpointSpec endpoint;
    endpoint.host = std::string(utils::trim(*request.host));
    endpoint.port = static_cast<uint16_t>(*request.port);
    endpoint.database = std::string(utils::trim(*request.database));
    endpoint.user = request.user;
    endpoint.password = request.password;
    endpoint.params = (request.params && !utils::trim(*request.params).empty())
        ? std::string(utils::trim(*request.params))
        : std::string(backend->default_params());

    const std::string handle = utils::generate_uuid();
    const std::string url = backend->canonical_url(endpoint);

    PoolConfig pool_config;
    pool_config.connection_string = backend->connection_uri(endpoint);
    pool_config.max_connections = config_.max_connections;
    pool_config.min_connections = config_.min_idle;
    pool_config.connection_timeout = timeouts.value().connection_timeout;
    pool_config.idle_timeout = timeouts.value().idle_timeout;
    pool_config.max_lifetime = timeouts.value().max_lifetime;
    pool_config.health_check_query = config_.validation_query;

    auto pool = backend->create_pool(handle, pool_config);
    if (!pool) {
        return R::error(ErrorCode::INTERNAL_ERROR, "Backend returned no pool");
    }

    // 4. Validation query: no handle for an unreachable endpoint
    std::string failure;
    if (pool->get_stats().total_connections == 0 && !pool->last_error().empty()) {
        // Pre-warm already failed; a second connect attempt would double the wait
        failure = pool->last_error();
    } else {
        auto conn = pool->acquire();
        if (!conn) {
            failure = pool->last_error();
        } else if (!(*conn)->is_healthy(config_.validation_query)) {
            conn->mark_broken();
            failure = "validation query failed";
        }
    }

    if (!failure.empty()) {
        pool->drain();
        utils::log::warn(std::format("Connection validation failed for {}: {}", url, failure));
        return R::error(ErrorCode::CONNECTION_UNAVAILABLE,
            std::format("Cannot establish connection: {}", failure));
    }

    // 5. Register
    auto managed = std::make_shared<ManagedConnection>();
    managed->handle = handle;
    managed->url = url;
    managed->sequence = next_sequence_.fetch_add(1, std::memory_order_relaxed);
    managed->type = request.type;
    managed->backend = std::move(backend);
    managed->pool = std::move(pool);
    managed->timeouts = timeouts.value();
    managed->created_at = std::chrono::system_clock::now();

    {
        std::unique_lock lock(mutex_);
        connections_.emplace(handle, std::move(managed));
    }

    utils::log::info(std::format("Connection created: {} -> {}", handle, url));
    return R::ok(ConnectionInfo{handle, url});
}

Result<std::shared_ptr<ManagedConnection>> ConnectionRegistry::get(const std::string& handle) const {
    std::shared_lock lock(mutex_);
    const auto it = connections_.find(handle);
    if (it == connections_.end()) {
        return Result<std::shared_ptr<ManagedConnection>>::error(
            ErrorCode::UNKNOWN_HANDLE, std::format("Unknown connectionId: {}", handle));
    }
    return Result<std::shared_ptr<ManagedConnection>>::ok(it->second);
}

std::vector<ConnectionInfo> ConnectionRegistry::list() const {
    std::vector<std::shared_ptr<ManagedConnection>> snapshot;
    {
        std::shared_lock lock(mutex_);
        snapshot.reserve(connections_.size());
        for (const auto& [_, managed] : connections_) {
            snapshot.push_back(managed);
        }
    }

    std::sort(snapshot.begin(), snapshot.end(),
        [](const auto& a, const auto& b) { return a->sequence < b->sequence; });

    std::vector<ConnectionInfo> result;
    result.reserve(snapshot.size());
    for (const auto& managed : snapshot) {
        result.push_back(ConnectionInfo{managed->handle, managed->url});
    }
    return result;
}

bool ConnectionRegistry::close(const std::string& handle) {
    std::shared_ptr<ManagedConnection> removed;
    {
        std::unique_lock lock(mutex_);
        const auto it = connections_.find(handle);
        if (it == connections_.end()) {
            return false;
        }
        removed = std::move(it->second);
        connections_.erase(it);
    }

    removed->pool->drain();
    utils::log::info(std::format("Connection closed: {}", handle));
    return true;
}

size_t ConnectionRegistry::close_all() {
    stop_housekeeper();

    std::unordered_map<std::string, std::shared_ptr<ManagedConnection>> all;
    {
        std::unique_lock lock(mutex_);
        all.swap(connections_);
    }

    for (auto& [handle, managed] : all) {
        managed->pool->drain();
    }

    if (!all.empty()) {
        utils::log::info(std::format("Closed {} connection(s)", all.size()));
    }
    return all.size();
}

size_t ConnectionRegistry::size() const {
    std::shared_lock lock(mutex_);
    return connections_.size();
}

std::optional<size_t> close_all_within(std::shared_ptr<ConnectionRegistry> registry,
                                       std::chrono::milliseconds timeout) {
    if (!registry) return size_t{0};

    std::promise<size_t> closed;
    auto result = closed.get_future();
    std::thread([registry = std::move(registry), p = std::move(closed)]() mutable {
        try {
            p.set_value(registry->close_all());
        } catch (...) {
            p.set_exception(std::current_exception());
        }
    }).detach();

    if (result.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }
    return result.get();
}

} // namespace sqlgate
