#pragma once

#include "server/server_types.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace graceful {

/**
 * @brief One access-log record, produced after the wrapped handler returns
 */
struct AccessLogEntry {
    std::string method;
    std::string target;        // Path plus query string, as requested
    std::string user_agent;
    std::string remote_addr;
    int status = 0;
    std::chrono::nanoseconds elapsed{0};  // Time spent inside the delegate only
};

/**
 * @brief Access-log decorator for request handlers
 *
 * wrap() returns a handler that behaves exactly like the delegate and emits
 * one AccessLogEntry per invocation, after the delegate returns (or throws).
 * The sink is the pluggable logging capability; the default writes one INFO
 * line via utils::log.
 *
 * A sink that throws is reported as a warning; it never changes the response.
 */
class RequestLogger {
public:
    using Sink = std::function<void(const AccessLogEntry&)>;

    [[nodiscard]] static Handler wrap(Handler next, Sink sink = default_sink());

    /// Middleware form of wrap(), for ServeOptions
    [[nodiscard]] static Middleware middleware(Sink sink = default_sink());

    /// Identity middleware (access logging disabled)
    [[nodiscard]] static Middleware passthrough();

    [[nodiscard]] static Sink default_sink();

    /// Served <target> for "<user-agent>" in <elapsed>
    [[nodiscard]] static std::string format_entry(const AccessLogEntry& entry);
};

} // namespace graceful
