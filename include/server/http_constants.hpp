#pragma once

#include <string>
#include <string_view>

namespace sqlgate::http {

inline constexpr std::string_view kBearerPrefix = "Bearer ";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kCsvContentType = "text/csv";

// User-facing replacements for SYSTEM / UNKNOWN error detail
inline const std::string kQuerySystemMessage =
    "Internal server error occurred while executing query";
inline const std::string kQueryUnknownMessage = "Failed to execute query";
inline const std::string kBrowseSystemMessage =
    "Internal server error occurred while fetching table data";
inline const std::string kBrowseUnknownMessage = "Failed to fetch table data";

} // namespace sqlgate::http
