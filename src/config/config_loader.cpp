#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace graceful {

// ============================================================================
// TOML Parsing Helpers (env expansion, extraction)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
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

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// Integers may arrive as strings after ${VAR} expansion ("${PORT}")
int64_t toml_int(const toml::node_view<const toml::node> node, const int64_t default_val,
                 const std::string_view key) {
    if (!node) return default_val;
    if (const auto v = node.value<int64_t>()) return *v;
    if (const auto* s = node.as_string()) {
        if (const auto parsed = utils::try_parse_int<int64_t>(utils::trim(s->get()))) {
            return *parsed;
        }
    }
    throw std::runtime_error(std::format("{} must be an integer", key));
}

ServerConfig extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);

    const auto port = toml_int(s["port"], kDefaultPort, "server.port");
    if (!utils::in_range<0, 65535>(port)) {
        throw std::runtime_error(std::format("server.port must be 1-65535, got {}", port));
    }
    cfg.port = static_cast<uint16_t>(port);

    const auto threads = toml_int(s["threads"], 8, "server.threads");
    cfg.thread_pool_size = threads > 0 ? static_cast<size_t>(threads) : 0;

    cfg.shutdown_timeout = std::chrono::milliseconds(
        toml_int(s["shutdown_timeout_ms"], 5000, "server.shutdown_timeout_ms"));
    cfg.read_timeout = std::chrono::milliseconds(
        toml_int(s["read_timeout_ms"], 5000, "server.read_timeout_ms"));
    cfg.write_timeout = std::chrono::milliseconds(
        toml_int(s["write_timeout_ms"], 5000, "server.write_timeout_ms"));

    const auto keep_alive_max = toml_int(s["keep_alive_max_count"], 100, "server.keep_alive_max_count");
    cfg.keep_alive_max_count = keep_alive_max > 0 ? static_cast<size_t>(keep_alive_max) : 0;
    cfg.keep_alive_timeout = std::chrono::seconds(
        toml_int(s["keep_alive_timeout_s"], 5, "server.keep_alive_timeout_s"));
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = l["level"].value_or("info"s);
    cfg.access_log = l["access_log"].value_or(true);
    return cfg;
}

AppConfig extract_all_sections(const toml::table& tbl) {
    AppConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

Status ConfigLoader::apply_env_overrides(AppConfig& config) {
    const char* env_port = std::getenv(kPortEnvVar);
    if (!env_port || !*env_port) {
        return Status::ok();
    }

    const auto port = utils::try_parse_int<int64_t>(utils::trim(env_port));
    if (!port || !utils::in_range<1, 65535>(*port)) {
        return Status::error(ErrorCategory::CONFIG_ERROR,
            std::format("{} must be an integer in 1-65535, got \"{}\"", kPortEnvVar, env_port));
    }
    config.server.port = static_cast<uint16_t>(*port);
    return Status::ok();
}

Result<AppConfig> ConfigLoader::from_environment() {
    AppConfig config;
    const auto status = apply_env_overrides(config);
    if (status.is_error()) {
        return Result<AppConfig>::error(status.error_category(), status.error_message());
    }
    return Result<AppConfig>::ok(std::move(config));
}

// ============================================================================
// Config Validation
// ============================================================================

namespace {

template<typename Duration>
void check_timeout(std::vector<std::string>& errors, const char* key, Duration value) {
    if (value.count() <= 0 || value > kMaxTimeout) {
        errors.push_back(std::format("{} must be > 0 and at most {} hours, got {}",
            key, kMaxTimeout.count(), value.count()));
    }
}

} // anonymous namespace

std::vector<std::string> ConfigLoader::validate_server_config(const ServerConfig& server) {
    std::vector<std::string> errors;

    if (!utils::in_range<1, 65535>(server.port)) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", server.port));
    }

    if (server.host.empty()) {
        errors.push_back("server.host must not be empty");
    }

    if (server.thread_pool_size == 0) {
        errors.push_back("server.threads must be > 0");
    }

    check_timeout(errors, "server.shutdown_timeout_ms", server.shutdown_timeout);
    check_timeout(errors, "server.read_timeout_ms", server.read_timeout);
    check_timeout(errors, "server.write_timeout_ms", server.write_timeout);

    // httplib closes a connection once its request budget is spent, so 0 serves nothing
    if (server.keep_alive_max_count == 0) {
        errors.push_back("server.keep_alive_max_count must be > 0");
    }

    check_timeout(errors, "server.keep_alive_timeout_s", server.keep_alive_timeout);

    return errors;
}

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    auto errors = validate_server_config(config.server);

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be info, warn or error, got \"{}\"",
            config.logging.level));
    }

    return errors;
}

} // namespace graceful
