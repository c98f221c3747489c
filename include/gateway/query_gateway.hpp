#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "remote/remote_types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sqlgate {

class IRemoteSqlClient;
class ICredentialStore;
class ResultCache;
class ErrorClassifier;
class DatabaseRegistry;

/**
 * @brief Query execution gateway
 *
 * run_query():
 * 1. Reject empty SQL (VALIDATION)
 * 2. Borrow the active credential (NO_ACTIVE_CREDENTIAL if none)
 * 3. fingerprint = md5(sql); a fresh cache entry is returned with from_cache
 * 4. Miss: one remote call; failures are classified and never cached or retried
 * 5. Success: cache put, elapsed time measured over the whole operation
 * 6. One outcome record per call, whatever the result
 *
 * Thread-safe: all shared state lives in the cache and credential store.
 */
class QueryGateway {
public:
    QueryGateway(std::shared_ptr<IRemoteSqlClient> client,
                 std::shared_ptr<ICredentialStore> credentials,
                 std::shared_ptr<ResultCache> cache,
                 std::shared_ptr<ErrorClassifier> classifier,
                 std::shared_ptr<DatabaseRegistry> registry = nullptr);

    [[nodiscard]] Result<ExecutionOutcome> run_query(const QueryRequest& request);

    /// Lists remote databases and mirrors them into the registry (if any).
    [[nodiscard]] Result<std::vector<DatabaseInfo>> list_databases();

    /// Live schema, not cached here.
    [[nodiscard]] Result<SchemaDescriptor> describe_schema(const std::string& database_id);

    struct Stats {
        uint64_t requests;
        uint64_t cache_hits;
        uint64_t remote_calls;
        uint64_t user_errors;
        uint64_t system_errors;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] GatewayError classify_failure(const RemoteFailure& failure);

    std::shared_ptr<IRemoteSqlClient> client_;
    std::shared_ptr<ICredentialStore> credentials_;
    std::shared_ptr<ResultCache> cache_;
    std::shared_ptr<ErrorClassifier> classifier_;
    std::shared_ptr<DatabaseRegistry> registry_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> remote_calls_{0};
    std::atomic<uint64_t> user_errors_{0};
    std::atomic<uint64_t> system_errors_{0};
};

} // namespace sqlgate
