#pragma once

#include <string>
#include <utility>
#include <vector>

namespace sqlgate {

// ============================================================================
// Response Types
// ============================================================================

/**
 * @brief Transport-independent response produced by ApiHandler
 *
 * HttpServer copies it onto the httplib::Response unchanged.
 */
struct ApiResponse {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
    std::vector<std::pair<std::string, std::string>> headers;

    static ApiResponse json(int status, std::string body) {
        ApiResponse r;
        r.status = status;
        r.body = std::move(body);
        return r;
    }
};

} // namespace sqlgate
