#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>

namespace sqlgate {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// ---- Section extractors ----------------------------------------------------

ServerConfig extract_server(const toml::table& root, std::vector<std::string>& errors) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or(cfg.host);
    cfg.port = s["port"].value_or(cfg.port);
    cfg.threads = s["threads"].value_or(cfg.threads);
    cfg.mcp_path = s["mcp_path"].value_or(cfg.mcp_path);
    cfg.shutdown_timeout_ms = s["shutdown_timeout_ms"].value_or(cfg.shutdown_timeout_ms);

    if (const auto transport = s["transport"].value<std::string>()) {
        if (const auto parsed = parse_transport(utils::to_lower(*transport))) {
            cfg.transport = *parsed;
        } else {
            errors.push_back(std::format("server.transport must be 'http' or 'stdio', got '{}'",
                *transport));
        }
    }
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = (*logging)["level"].value_or(cfg.level);
    }
    return cfg;
}

WriteGate::Config extract_write(const toml::table& root) {
    WriteGate::Config cfg;
    const auto* write = root["write"].as_table();
    if (!write) return cfg;
    const auto& w = *write;

    cfg.writes_enabled = w["enabled"].value_or(cfg.writes_enabled);
    if (w["whitelist"].as_array()) {
        cfg.whitelist = toml_string_array(w, "whitelist");
    }
    return cfg;
}

WriteAuditLog::Config extract_audit(const toml::table& root) {
    WriteAuditLog::Config cfg;
    const auto* audit = root["audit"].as_table();
    if (!audit) return cfg;
    const auto& a = *audit;

    cfg.enabled = a["enabled"].value_or(cfg.enabled);
    // Read signed so a negative capacity is reported instead of wrapping
    const auto max_entries = a["max_entries"].value_or(static_cast<int64_t>(cfg.max_entries));
    cfg.max_entries = max_entries > 0 ? static_cast<size_t>(max_entries) : 0;
    return cfg;
}

ResultShaper::Config extract_limits(const toml::table& root) {
    ResultShaper::Config cfg;
    if (const auto* limits = root["limits"].as_table()) {
        cfg.max_query_rows = (*limits)["max_query_rows"].value_or(cfg.max_query_rows);
        cfg.max_field_length = (*limits)["max_field_length"].value_or(cfg.max_field_length);
    }
    return cfg;
}

ConnectionRegistry::Config extract_pool(const toml::table& root, std::vector<std::string>& errors) {
    ConnectionRegistry::Config cfg;
    const auto* pool = root["pool"].as_table();
    if (!pool) return cfg;
    const auto& p = *pool;

    const auto max_connections = p["max_connections"].value_or(static_cast<int64_t>(cfg.max_connections));
    const auto min_idle = p["min_idle"].value_or(static_cast<int64_t>(cfg.min_idle));
    if (max_connections <= 0) {
        errors.push_back(std::format("pool.max_connections must be > 0, got {}", max_connections));
    } else {
        cfg.max_connections = static_cast<size_t>(max_connections);
    }
    if (min_idle < 0) {
        errors.push_back(std::format("pool.min_idle must be >= 0, got {}", min_idle));
    } else {
        cfg.min_idle = static_cast<size_t>(min_idle);
    }

    const auto read_ms = [&](std::string_view key, std::chrono::milliseconds& target) {
        const auto ms = p[key].value_or(static_cast<int64_t>(target.count()));
        if (ms <= 0 || ms > TimeoutPolicy::MAX_TIMEOUT_MS) {
            errors.push_back(std::format("pool.{} must be between 1 and {}, got {}",
                key, TimeoutPolicy::MAX_TIMEOUT_MS, ms));
        } else {
            target = std::chrono::milliseconds{ms};
        }
    };
    read_ms("connection_timeout_ms", cfg.default_timeouts.connection_timeout);
    read_ms("idle_timeout_ms", cfg.default_timeouts.idle_timeout);
    read_ms("max_lifetime_ms", cfg.default_timeouts.max_lifetime);

    // 0 turns the housekeeper off
    const auto housekeeping_ms = p["housekeeping_interval_ms"].value_or(
        static_cast<int64_t>(cfg.housekeeping_interval.count()));
    if (housekeeping_ms < 0 || housekeeping_ms > TimeoutPolicy::MAX_TIMEOUT_MS) {
        errors.push_back(std::format("pool.housekeeping_interval_ms must be between 0 and {}, got {}",
            TimeoutPolicy::MAX_TIMEOUT_MS, housekeeping_ms));
    } else {
        cfg.housekeeping_interval = std::chrono::milliseconds{housekeeping_ms};
    }

    cfg.validation_query = p["validation_query"].value_or(cfg.validation_query);
    return cfg;
}

SqlGateConfig extract_all_sections(const toml::table& tbl, std::vector<std::string>& errors) {
    SqlGateConfig config;
    config.server = extract_server(tbl, errors);
    config.logging = extract_logging(tbl);
    config.write = extract_write(tbl);
    config.audit = extract_audit(tbl);
    config.limits = extract_limits(tbl);
    config.pool = extract_pool(tbl, errors);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(
    SqlGateConfig config, std::vector<std::string> errors) {

    for (auto& err : validate_config(config)) {
        errors.push_back(std::move(err));
    }
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        utils::log::warn(std::format("Config file '{}' not found, using defaults", config_path));
        return validate_and_return(SqlGateConfig{}, {});
    }

    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const SqlGateConfig& config) {
    std::vector<std::string> errors;

    if (!utils::in_range<1, 65535>(config.server.port)) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (config.server.threads <= 0) {
        errors.push_back(std::format("server.threads must be > 0, got {}", config.server.threads));
    }
    if (config.server.mcp_path.empty() || config.server.mcp_path.front() != '/') {
        errors.push_back(std::format("server.mcp_path must start with '/', got '{}'",
            config.server.mcp_path));
    }
    if (config.server.shutdown_timeout_ms <= 0 ||
        config.server.shutdown_timeout_ms > TimeoutPolicy::MAX_TIMEOUT_MS) {
        errors.push_back(std::format("server.shutdown_timeout_ms must be between 1 and {}, got {}",
            TimeoutPolicy::MAX_TIMEOUT_MS, config.server.shutdown_timeout_ms));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
            config.logging.level));
    }

    if (config.audit.max_entries == 0) {
        errors.push_back("audit.max_entries must be > 0");
    }

    if (config.limits.max_query_rows <= 0) {
        errors.push_back(std::format("limits.max_query_rows must be > 0, got {}",
            config.limits.max_query_rows));
    }
    if (config.limits.max_field_length <= 0) {
        errors.push_back(std::format("limits.max_field_length must be > 0, got {}",
            config.limits.max_field_length));
    }

    if (config.pool.min_idle > config.pool.max_connections) {
        errors.push_back(std::format("pool.min_idle ({}) > pool.max_connections ({})",
            config.pool.min_idle, config.pool.max_connections));
    }
    if (utils::trim(config.pool.validation_query).empty()) {
        errors.push_back("pool.validation_query must not be empty");
    }

    for (size_t i = 0; i < config.write.whitelist.size(); ++i) {
        if (utils::trim(config.write.whitelist[i]).empty()) {
            errors.push_back(std::format("write.whitelist[{}] must not be blank", i));
        }
    }

    return errors;
}

} // namespace sqlgate
