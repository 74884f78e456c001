#include "server/request_logger.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <format>
#include <stdexcept>
#include <utility>

namespace graceful {

namespace {

// httplib fills target with the raw request line; fall back to the path
// for requests that were built by hand.
std::string request_target(const httplib::Request& req) {
    if (!req.target.empty()) return req.target;
    if (req.params.empty()) return req.path;

    std::string target = req.path;
    char sep = '?';
    for (const auto& [key, value] : req.params) {
        target += sep;
        target += key;
        target += '=';
        target += value;
        sep = '&';
    }
    return target;
}

void emit(const RequestLogger::Sink& sink, const AccessLogEntry& entry) {
    if (!sink) return;
    try {
        sink(entry);
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Access log sink failed for {}: {}", entry.target, e.what()));
    }
}

} // anonymous namespace

Handler RequestLogger::wrap(Handler next, Sink sink) {
    if (!next) {
        throw std::invalid_argument("RequestLogger::wrap requires a handler");
    }
    return [next = std::move(next), sink = std::move(sink)](
               const httplib::Request& req, httplib::Response& res) {
        AccessLogEntry entry;
        entry.method = req.method;
        entry.target = request_target(req);
        entry.user_agent = req.get_header_value(http::kUserAgentHeader);
        entry.remote_addr = req.remote_addr;

        const auto start = std::chrono::steady_clock::now();
        try {
            next(req, res);
        } catch (...) {
            entry.elapsed = std::chrono::steady_clock::now() - start;
            entry.status = res.status;
            emit(sink, entry);
            throw;
        }
        entry.elapsed = std::chrono::steady_clock::now() - start;
        entry.status = res.status;
        emit(sink, entry);
    };
}

Middleware RequestLogger::middleware(Sink sink) {
    return [sink = std::move(sink)](Handler next) {
        return wrap(std::move(next), sink);
    };
}

Middleware RequestLogger::passthrough() {
    return [](Handler next) { return next; };
}

RequestLogger::Sink RequestLogger::default_sink() {
    return [](const AccessLogEntry& entry) {
        utils::log::info(format_entry(entry));
    };
}

std::string RequestLogger::format_entry(const AccessLogEntry& entry) {
    return std::format("Served {} for {} in {}",
        entry.target, utils::quote(entry.user_agent), utils::format_duration(entry.elapsed));
}

} // namespace graceful
