#pragma once

#include "core/types.hpp"
#include "remote/remote_types.hpp"

#include <string>
#include <vector>

namespace sqlgate {

/**
 * @brief Abstract remote SQL endpoint
 *
 * Every call is a blocking network round trip bounded by the implementation's
 * timeout. No retries: a failed call is reported once, as a RemoteFailure.
 * The credential is borrowed for the duration of the call only.
 */
class IRemoteSqlClient {
public:
    virtual ~IRemoteSqlClient() = default;

    /**
     * @brief Execute one SQL statement
     * @param credential Account + bearer token for this call
     * @param database_id Remote-assigned database identifier
     * @param sql Non-empty SQL text
     */
    [[nodiscard]] virtual RemoteResult<ExecutionResult> execute(
        const CredentialSet& credential,
        const std::string& database_id,
        const std::string& sql) = 0;

    [[nodiscard]] virtual RemoteResult<std::vector<DatabaseInfo>> list_databases(
        const CredentialSet& credential) = 0;

    /// Tables and views of one database, via a fixed introspection query.
    [[nodiscard]] virtual RemoteResult<SchemaDescriptor> describe_schema(
        const CredentialSet& credential,
        const std::string& database_id) = 0;
};

} // namespace sqlgate
