#pragma once

#include "remote/iremote_sql_client.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace sqlgate {

/**
 * @brief HTTPS client for the remote D1 SQL service
 *
 * Uses httplib::Client, one connection per call. Endpoints:
 * - POST {prefix}/accounts/{account}/d1/database/{db}/query  body {"sql": ...}
 * - GET  {prefix}/accounts/{account}/d1/database
 *
 * Responses are narrowed by envelope::decode_* before leaving this class.
 */
class D1SqlClient : public IRemoteSqlClient {
public:
    struct Config {
        std::string base_url = "https://api.cloudflare.com";
        std::string api_prefix = "/client/v4";
        uint32_t timeout_ms = 30000;
    };

    D1SqlClient();
    explicit D1SqlClient(Config config);

    [[nodiscard]] RemoteResult<ExecutionResult> execute(
        const CredentialSet& credential,
        const std::string& database_id,
        const std::string& sql) override;

    [[nodiscard]] RemoteResult<std::vector<DatabaseInfo>> list_databases(
        const CredentialSet& credential) override;

    [[nodiscard]] RemoteResult<SchemaDescriptor> describe_schema(
        const CredentialSet& credential,
        const std::string& database_id) override;

    /// Request body for the query endpoint: {"sql":"..."}
    [[nodiscard]] static std::string build_query_body(const std::string& sql);

    struct Stats {
        uint64_t requests = 0;
        uint64_t transport_failures = 0;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] std::string database_path(const CredentialSet& credential) const;

    Config config_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> transport_failures_{0};
};

} // namespace sqlgate
