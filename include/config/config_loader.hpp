#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"

#include <string>
#include <vector>

namespace graceful {

// Environment variable selecting the listen port
inline constexpr const char* kPortEnvVar = "PORT";

// ============================================================================
// ConfigLoader - Extract typed config from TOML and the environment
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
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
     * @brief Load complete config from TOML file
     * @param config_path Path to the .toml file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Apply environment overrides (PORT) on top of a loaded config
     *
     * An unset or empty PORT leaves the configured port untouched.
     * A PORT that is not an integer in 1-65535 is a CONFIG_ERROR.
     */
    [[nodiscard]] static Status apply_env_overrides(AppConfig& config);

    /**
     * @brief Built-in defaults plus environment overrides
     */
    [[nodiscard]] static Result<AppConfig> from_environment();

    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

    /// Server-section checks of validate_config, also run before binding
    [[nodiscard]] static std::vector<std::string> validate_server_config(const ServerConfig& server);

private:
    static LoadResult validate_and_return(AppConfig config);
};

} // namespace graceful
