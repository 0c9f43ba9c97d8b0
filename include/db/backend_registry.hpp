#pragma once

#include "db/idb_backend.hpp"
#include "core/database_type.hpp"
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace sqlgate {

/**
 * @brief Registry for database backends
 *
 * Each engine compiled in registers a factory (static initializer in its
 * backend source, repeated explicitly from main). ConnectionRegistry asks
 * for a fresh backend per createConnection call.
 *
 * Usage:
 *   // Registration (in mysql_backend.cpp):
 *   BackendRegistry::instance().register_backend(
 *       DatabaseType::MYSQL, []{ return std::make_unique<MysqlBackend>(); });
 *
 *   // Lookup (in the connection registry):
 *   auto backend = BackendRegistry::instance().create(DatabaseType::MYSQL);
 */
class BackendRegistry {
public:
    using Factory = std::function<std::unique_ptr<IDbBackend>()>;

    static BackendRegistry& instance() {
        static BackendRegistry registry;
        return registry;
    }

    void register_backend(DatabaseType type, Factory factory) {
        factories_[type] = std::move(factory);
    }

    /**
     * @brief Instantiate the backend for a type
     * @throws std::runtime_error if the engine was not compiled in
     */
    [[nodiscard]] std::unique_ptr<IDbBackend> create(DatabaseType type) const {
        const auto it = factories_.find(type);
        if (it == factories_.end()) {
            throw std::runtime_error(
                std::string("No backend registered for database type: ") +
                std::string(database_type_to_string(type)));
        }
        return it->second();
    }

    [[nodiscard]] bool has_backend(DatabaseType type) const {
        return factories_.count(type) > 0;
    }

    /**
     * @brief Engines compiled into this binary, e.g. "mysql, postgresql"
     */
    [[nodiscard]] std::string describe() const {
        std::string names;
        for (const auto type : {DatabaseType::MYSQL, DatabaseType::POSTGRESQL}) {
            if (!has_backend(type)) continue;
            if (!names.empty()) names += ", ";
            names += database_type_to_string(type);
        }
        return names;
    }

private:
    BackendRegistry() = default;

    struct DatabaseTypeHash {
        size_t operator()(DatabaseType t) const {
            return std::hash<int>()(static_cast<int>(t));
        }
    };

    std::unordered_map<DatabaseType, Factory, DatabaseTypeHash> factories_;
};

} // namespace sqlgate
