#pragma once

#include <string>

namespace graceful::http {

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kUserAgentHeader = "User-Agent";
inline const std::string kConnectionHeader = "Connection";
inline constexpr const char* kTextContentType = "text/plain";

inline constexpr int kStatusServiceUnavailable = 503;

} // namespace graceful::http
