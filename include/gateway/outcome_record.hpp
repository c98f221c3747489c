#pragma once

#include "core/error.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sqlgate {

// ============================================================================
// Outcome Record
// ============================================================================

enum class OutcomeOperation : uint8_t {
    QUERY,          // [QUERY ...]
    TABLE_ROWS      // [TABLE_ROWS ...]
};

/**
 * @brief One observability record per gateway request
 *
 * Rendered as a tagged JSON line:
 *   [QUERY SUCCESS] {"dbId":"db-1","queryHash":"...","duration":"12ms",...}
 */
struct OutcomeRecord {
    OutcomeOperation operation = OutcomeOperation::QUERY;
    std::string database_id;
    std::string fingerprint;            // QUERY only
    std::string table_name;             // TABLE_ROWS only
    int64_t elapsed_ms = 0;
    int64_t row_count = 0;
    std::optional<int64_t> page_size;   // TABLE_ROWS only
    std::optional<int64_t> offset;      // TABLE_ROWS only
    bool from_cache = false;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error_message;          // server-side detail, never sent to clients
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    /// "[QUERY SUCCESS]", "[TABLE_ROWS USER_ERROR]", ...
    [[nodiscard]] std::string tag() const;

    /// JSON object body of the record
    [[nodiscard]] std::string to_json() const;
};

/**
 * @brief Write a record to the log
 *
 * Severity: success, USER and caller-caused errors → info;
 * SYSTEM / UNKNOWN → error. Rendering failures are downgraded to a warning.
 */
void emit_outcome(const OutcomeRecord& record);

} // namespace sqlgate
