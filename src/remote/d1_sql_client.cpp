#include "remote/d1_sql_client.hpp"
#include "remote/envelope.hpp"
#include "server/http_constants.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <chrono>
#include <format>

namespace sqlgate {

namespace {

httplib::Headers auth_headers(const CredentialSet& credential) {
    return {
        {http::kAuthorizationHeader, std::string(http::kBearerPrefix) + credential.api_token},
        {"Content-Type", http::kJsonContentType}
    };
}

/// Connection, read and write timeouts all take the configured budget
void apply_timeouts(httplib::Client& cli, uint32_t timeout_ms) {
    const auto timeout = std::chrono::milliseconds(timeout_ms);
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);
}

std::string reason_of(const httplib::Response& res) {
    if (!res.reason.empty()) return res.reason;
    return httplib::status_message(res.status);
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

D1SqlClient::D1SqlClient() = default;

D1SqlClient::D1SqlClient(Config config)
    : config_(std::move(config)) {}

std::string D1SqlClient::database_path(const CredentialSet& credential) const {
    return std::format("{}/accounts/{}/d1/database", config_.api_prefix, credential.account_id);
}

std::string D1SqlClient::build_query_body(const std::string& sql) {
    json::Json body = json::make_object();
    body["sql"] = sql;
    return json::dump(body);
}

// ============================================================================
// Remote calls
// ============================================================================

RemoteResult<ExecutionResult> D1SqlClient::execute(
    const CredentialSet& credential,
    const std::string& database_id,
    const std::string& sql) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    httplib::Client cli(config_.base_url);
    apply_timeouts(cli, config_.timeout_ms);

    const auto path = std::format("{}/{}/query", database_path(credential), database_id);
    const auto res = cli.Post(path, auth_headers(credential),
                              build_query_body(sql), http::kJsonContentType);

    if (!res) {
        transport_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("D1 query request failed: {}",
                                     httplib::to_string(res.error())));
        return RemoteResult<ExecutionResult>::failure(
            RemoteFailure::transport(0, httplib::to_string(res.error())));
    }

    return envelope::decode_query_response(res->status, reason_of(*res), res->body);
}

RemoteResult<std::vector<DatabaseInfo>> D1SqlClient::list_databases(
    const CredentialSet& credential) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    httplib::Client cli(config_.base_url);
    apply_timeouts(cli, config_.timeout_ms);

    const auto res = cli.Get(database_path(credential), auth_headers(credential));
    if (!res) {
        transport_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("D1 database list request failed: {}",
                                     httplib::to_string(res.error())));
        return RemoteResult<std::vector<DatabaseInfo>>::failure(
            RemoteFailure::transport(0, httplib::to_string(res.error())));
    }

    return envelope::decode_database_list(res->status, reason_of(*res), res->body);
}

RemoteResult<SchemaDescriptor> D1SqlClient::describe_schema(
    const CredentialSet& credential,
    const std::string& database_id) {
    auto result = execute(credential, database_id, std::string(envelope::kSchemaQuery));
    if (!result.is_ok()) {
        return RemoteResult<SchemaDescriptor>::failure(result.failure());
    }
    return RemoteResult<SchemaDescriptor>::ok(envelope::schema_from_rows(result.value().rows));
}

D1SqlClient::Stats D1SqlClient::get_stats() const {
    return {
        requests_.load(std::memory_order_relaxed),
        transport_failures_.load(std::memory_order_relaxed)
    };
}

} // namespace sqlgate
