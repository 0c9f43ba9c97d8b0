#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace sqlgate {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        SqlGateConfig config;

        static LoadResult ok(SqlGateConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     *
     * A missing file is not an error: defaults are returned and a warning
     * is logged. ${VAR} in string values is replaced by the environment.
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief All problems found in a config (empty when valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const SqlGateConfig& config);

private:
    static LoadResult validate_and_return(SqlGateConfig config, std::vector<std::string> errors);
};

} // namespace sqlgate
