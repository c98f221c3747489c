#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "server/server_types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace sqlgate {

class IRemoteSqlClient;
class CredentialStore;
class ErrorClassifier;
class QueryGateway;
class TableBrowsePlanner;

/**
 * @brief Route logic of the REST surface, one method per endpoint
 *
 * Methods take already-extracted path/query/body parts and return an
 * ApiResponse. Error bodies always carry the empty result shape of their
 * endpoint (results/rows = [], rowCount = 0).
 */
class ApiHandler {
public:
    struct Config {
        size_t max_body_length = 102400;
        int64_t default_limit = 50;
        int64_t max_limit = 100;
    };

    ApiHandler(std::shared_ptr<IRemoteSqlClient> client,
               std::shared_ptr<CredentialStore> credentials,
               std::shared_ptr<ErrorClassifier> classifier,
               std::shared_ptr<QueryGateway> gateway,
               std::shared_ptr<TableBrowsePlanner> planner,
               Config config);

    // ── Core ────────────────────────────────────────────────────────────
    [[nodiscard]] ApiResponse health() const;

    [[nodiscard]] ApiResponse run_query(const std::string& database_id,
                                        const std::string& body);

    /// limit/offset are the raw query-string values (nullopt when absent)
    [[nodiscard]] ApiResponse table_rows(const std::string& database_id,
                                         const std::string& table_name,
                                         const std::optional<std::string>& limit,
                                         const std::optional<std::string>& offset);

    // ── Discovery ───────────────────────────────────────────────────────
    [[nodiscard]] ApiResponse list_databases();
    [[nodiscard]] ApiResponse describe_schema(const std::string& database_id);

    // ── Credentials ─────────────────────────────────────────────────────
    [[nodiscard]] ApiResponse create_api_key(const std::string& body);
    [[nodiscard]] ApiResponse list_api_keys() const;
    [[nodiscard]] ApiResponse delete_api_key(const std::string& id);

    // ── Export ──────────────────────────────────────────────────────────
    [[nodiscard]] ApiResponse export_data(const std::string& body) const;

    /// {"message": ...} with the given status
    [[nodiscard]] static ApiResponse message_response(int status, const std::string& message);

private:
    [[nodiscard]] ApiResponse query_failure(const GatewayError& error, int64_t elapsed_ms) const;
    [[nodiscard]] ApiResponse rows_failure(const GatewayError& error, int64_t page_size) const;

    std::shared_ptr<IRemoteSqlClient> client_;
    std::shared_ptr<CredentialStore> credentials_;
    std::shared_ptr<ErrorClassifier> classifier_;
    std::shared_ptr<QueryGateway> gateway_;
    std::shared_ptr<TableBrowsePlanner> planner_;
    Config config_;
};

} // namespace sqlgate
