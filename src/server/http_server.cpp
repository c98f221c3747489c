#include "server/http_server.hpp"
#include "server/api_handler.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

// Suppress cpp-httplib internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <optional>
#include <stdexcept>

namespace sqlgate {

namespace {

std::optional<std::string> query_param(const httplib::Request& req, const std::string& key) {
    if (!req.has_param(key)) return std::nullopt;
    return req.get_param_value(key);
}

} // anonymous namespace

HttpServer::HttpServer(std::shared_ptr<ApiHandler> handler,
                       std::string host,
                       int port,
                       size_t thread_pool_size)
    : handler_(std::move(handler)),
      host_(std::move(host)),
      port_(port),
      thread_pool_size_(thread_pool_size) {}

HttpServer::~HttpServer() = default;

void HttpServer::write(const ApiResponse& api, httplib::Response& res) {
    res.status = api.status;
    for (const auto& [name, value] : api.headers) {
        res.set_header(name, value);
    }
    res.set_content(api.body, api.content_type);
}

// ============================================================================
// start(): creates the server, registers routes, listens
// ============================================================================

void HttpServer::start() {
    server_ = std::make_unique<httplib::Server>();
    auto& svr = *server_;

    const size_t pool_size = thread_pool_size_;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    register_routes(svr);

    utils::log::info(std::format("Starting sqlgate on {}:{} ({} threads)",
        host_, port_, thread_pool_size_));

    if (!svr.listen(host_, port_)) {
        throw std::runtime_error(
            std::format("Failed to start HTTP server on {}:{}", host_, port_));
    }
}

void HttpServer::stop() {
    if (server_) {
        server_->stop();
    }
    utils::log::info("Server stopped");
}

template<typename Fn>
void HttpServer::dispatch(const httplib::Request& req, httplib::Response& res, Fn&& fn) {
    requests_.fetch_add(1, std::memory_order_relaxed);
    try {
        write(fn(), res);
    } catch (const std::exception& e) {
        handler_exceptions_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("[HTTP UNKNOWN_ERROR] {} {}: {}",
                                      req.method, req.path, e.what()));
        write(ApiHandler::message_response(500, "Internal server error"), res);
    }
}

HttpServer::HttpStats HttpServer::get_http_stats() const {
    return {
        requests_.load(std::memory_order_relaxed),
        handler_exceptions_.load(std::memory_order_relaxed)
    };
}

// ============================================================================
// Route registration
// ============================================================================

void HttpServer::register_routes(httplib::Server& svr) {
    svr.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        dispatch(req, res, [&] { return handler_->health(); });
    });

    // ── Credentials ─────────────────────────────────────────────────────
    svr.Post("/api/api-keys", [this](const httplib::Request& req, httplib::Response& res) {
        dispatch(req, res, [&] { return handler_->create_api_key(req.body); });
    });
    svr.Get("/api/api-keys", [this](const httplib::Request& req, httplib::Response& res) {
        dispatch(req, res, [&] { return handler_->list_api_keys(); });
    });
    svr.Delete("/api/api-keys/:id", [this](const httplib::Request& req, httplib::Response& res) {
        dispatch(req, res, [&] { return handler_->delete_api_key(req.path_params.at("id")); });
    });

    // ── Databases ───────────────────────────────────────────────────────
    svr.Get("/api/databases", [this](const httplib::Request& req, httplib::Response& res) {
        dispatch(req, res, [&] { return handler_->list_databases(); });
    });
    svr.Get("/api/databases/:id/schema", [this](const httplib::Request& req, httplib::Response& res) {
        dispatch(req, res, [&] { return handler_->describe_schema(req.path_params.at("id")); });
    });
    svr.Post("/api/databases/:id/query", [this](const httplib::Request& req, httplib::Response& res) {
        dispatch(req, res, [&] {
            return handler_->run_query(req.path_params.at("id"), req.body);
        });
    });
    svr.Get("/api/databases/:id/tables/:table/rows",
            [this](const httplib::Request& req, httplib::Response& res) {
        dispatch(req, res, [&] {
            return handler_->table_rows(req.path_params.at("id"),
                                        req.path_params.at("table"),
                                        query_param(req, "limit"),
                                        query_param(req, "offset"));
        });
    });

    // ── Export ──────────────────────────────────────────────────────────
    svr.Post("/api/export", [this](const httplib::Request& req, httplib::Response& res) {
        dispatch(req, res, [&] { return handler_->export_data(req.body); });
    });
}

} // namespace sqlgate
