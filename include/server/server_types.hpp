#pragma once

#include <functional>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
}

namespace graceful {

// ============================================================================
// Handler Types
// ============================================================================

/// Handles one request and produces one response
using Handler = std::function<void(const httplib::Request&, httplib::Response&)>;

/// Decorates a handler (access logging, admission control)
using Middleware = std::function<Handler(Handler)>;

} // namespace graceful
