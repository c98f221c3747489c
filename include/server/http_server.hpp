#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace sqlgate {

class ApiHandler;
struct ApiResponse;

/**
 * @brief HTTP server for the query gateway
 *
 * Routes:
 *   GET    /health
 *   POST   /api/api-keys              GET /api/api-keys
 *   DELETE /api/api-keys/:id
 *   GET    /api/databases
 *   GET    /api/databases/:id/schema
 *   POST   /api/databases/:id/query
 *   GET    /api/databases/:id/tables/:table/rows?limit&offset
 *   POST   /api/export
 *
 * Route bodies live in ApiHandler; this class only adapts httplib to it.
 * A std::exception escaping a route body becomes a 500 with a generic message.
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<ApiHandler> handler,
               std::string host = "0.0.0.0",
               int port = 8080,
               size_t thread_pool_size = 8);
    ~HttpServer();

    /// Blocks until stop() is called. Throws if the socket cannot be bound.
    void start();
    void stop();

    struct HttpStats {
        uint64_t requests;
        uint64_t handler_exceptions;
    };
    [[nodiscard]] HttpStats get_http_stats() const;

private:
    void register_routes(httplib::Server& svr);

    /// Runs one route body; a std::exception becomes a logged 500
    template<typename Fn>
    void dispatch(const httplib::Request& req, httplib::Response& res, Fn&& fn);

    /// Copies an ApiResponse onto the httplib response
    static void write(const ApiResponse& api, httplib::Response& res);

    std::shared_ptr<ApiHandler> handler_;
    std::string host_;
    int port_;
    size_t thread_pool_size_;

    std::unique_ptr<httplib::Server> server_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> handler_exceptions_{0};
};

} // namespace sqlgate
