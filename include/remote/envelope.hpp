#pragma once

#include "core/types.hpp"
#include "remote/remote_types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sqlgate::envelope {

/// Introspection query used by describe_schema.
inline constexpr std::string_view kSchemaQuery =
    "SELECT name, type, sql FROM sqlite_master "
    "WHERE type IN ('table', 'view') ORDER BY name;";

inline constexpr std::string_view kMalformedEnvelope = "malformed response envelope";

/**
 * @brief Narrow a query response into ExecutionResult or RemoteFailure
 *
 * Envelope: {success, errors:[{message}], result:{results:[...], duration?,
 * changes?, count?}}. `result` may also arrive as a one-element array and the
 * counters may sit under `result.meta`.
 *
 * @param status HTTP status code
 * @param reason HTTP reason phrase (used only for non-2xx)
 * @param body Raw response body
 */
[[nodiscard]] RemoteResult<ExecutionResult> decode_query_response(
    int status, std::string_view reason, std::string_view body);

/// Narrow a database list response: result:[{uuid, name, created_at, version, running_in_region}]
[[nodiscard]] RemoteResult<std::vector<DatabaseInfo>> decode_database_list(
    int status, std::string_view reason, std::string_view body);

/// Rows of kSchemaQuery → schema objects. Rows of any other kind are skipped.
[[nodiscard]] SchemaDescriptor schema_from_rows(const std::vector<Row>& rows);

} // namespace sqlgate::envelope
