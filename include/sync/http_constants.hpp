#pragma once

#include <string>
#include <string_view>

namespace shiplog::http {

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kApiKeyHeader = "X-API-Key";
inline const std::string kUserAgentHeader = "User-Agent";
inline const std::string kAcceptHeader = "Accept";
inline constexpr const char* kJsonContentType = "application/json";

inline constexpr std::string_view kHealthPath = "/health";
inline constexpr std::string_view kEventsPath = "/events";
inline constexpr std::string_view kPhpEntryPoint = "/api.php";

} // namespace shiplog::http
