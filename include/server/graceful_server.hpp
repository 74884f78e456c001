#pragma once

#include "config/config_types.hpp"
#include "server/server_types.hpp"
#include "server/shutdown_coordinator.hpp"

namespace graceful {

/**
 * @brief Serve handler on the port named by $PORT (8080 if unset or empty)
 *
 * Requests are logged by RequestLogger. Blocks until SIGINT or SIGTERM is
 * received and the listener is closed, or the shutdown timeout expires.
 * Never throws and reports nothing: failures are logged.
 */
void serve(Handler handler);

/**
 * @brief Serve handler with explicit options (port, timeout, middleware)
 */
void serve(Handler handler, ServeOptions options);

/**
 * @brief ServeOptions for a loaded config
 *
 * Access logging follows logging.access_log; when disabled the handler is
 * served unwrapped.
 */
[[nodiscard]] ServeOptions make_serve_options(const AppConfig& config);

} // namespace graceful
