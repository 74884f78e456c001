#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace graceful {

// ============================================================================
// Configuration Types
// ============================================================================

inline constexpr uint16_t kDefaultPort = 8080;

// Upper bound for every configured timeout; keeps deadline arithmetic in range
inline constexpr std::chrono::hours kMaxTimeout{24};

struct ServerConfig {
    std::string host;
    uint16_t port;
    size_t thread_pool_size;
    std::chrono::milliseconds shutdown_timeout;  // Bound on the graceful drain
    std::chrono::milliseconds read_timeout;
    std::chrono::milliseconds write_timeout;
    size_t keep_alive_max_count;
    std::chrono::seconds keep_alive_timeout;

    ServerConfig()
        : host("0.0.0.0"),
          port(kDefaultPort),
          thread_pool_size(8),
          shutdown_timeout(5000),
          read_timeout(5000),
          write_timeout(5000),
          keep_alive_max_count(100),
          keep_alive_timeout(5) {}
};

struct LoggingConfig {
    std::string level = "info";
    bool access_log = true;
};

// ============================================================================
// AppConfig - Complete parsed configuration
// ============================================================================

struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
};

} // namespace graceful
