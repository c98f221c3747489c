#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace sqlgate {

// ============================================================================
// Row Values
// ============================================================================

/**
 * @brief One scalar cell as narrowed from the remote service.
 *
 * Nested JSON (arrays/objects) never reaches this type; the envelope decoder
 * re-serializes it to text before building a row.
 */
using CellValue = std::variant<std::monostate, bool, int64_t, double, std::string>;

/**
 * @brief One result record: column name → scalar.
 *
 * Field order is the remote column order, kept from the JSON text of each
 * row and used again when rows are rendered or exported.
 */
struct Row {
    std::vector<std::pair<std::string, CellValue>> fields;

    [[nodiscard]] const CellValue* find(std::string_view column) const {
        for (const auto& [name, value] : fields) {
            if (name == column) return &value;
        }
        return nullptr;
    }

    bool operator==(const Row&) const = default;
};

// ============================================================================
// Credentials
// ============================================================================

/// Account identifier + bearer token. Borrowed per request, never persisted.
struct CredentialSet {
    std::string account_id;
    std::string api_token;
};

// ============================================================================
// Requests
// ============================================================================

struct QueryRequest {
    std::string database_id;
    std::string sql_text;
};

struct TableBrowseRequest {
    std::string database_id;
    std::string table_name;
    int64_t limit = 50;
    int64_t offset = 0;
};

// ============================================================================
// Remote Execution Types
// ============================================================================

/// Narrowed success payload of one remote execution.
struct ExecutionResult {
    std::vector<Row> rows;
    std::optional<int64_t> elapsed_ms;        // remote-reported duration
    std::optional<int64_t> changed_row_count;
    std::optional<int64_t> total_count;
};

enum class SchemaObjectKind : uint8_t {
    TABLE,
    VIEW
};

[[nodiscard]] inline const char* schema_object_kind_to_string(SchemaObjectKind kind) {
    switch (kind) {
        case SchemaObjectKind::TABLE: return "table";
        case SchemaObjectKind::VIEW:  return "view";
        default:                      return "unknown";
    }
}

struct SchemaObject {
    std::string name;
    SchemaObjectKind kind = SchemaObjectKind::TABLE;
    std::string definition;
};

using SchemaDescriptor = std::vector<SchemaObject>;

struct DatabaseInfo {
    std::string id;
    std::string name;
    std::string created_at;
    std::string version;
    std::string region;
};

// ============================================================================
// Gateway Outcomes
// ============================================================================

struct ExecutionOutcome {
    std::vector<Row> rows;
    int64_t row_count = 0;
    std::optional<int64_t> changed_row_count;
    int64_t elapsed_ms = 0;
    bool from_cache = false;
};

struct BrowsePage {
    std::vector<Row> rows;
    int64_t row_count = 0;
    int64_t page_size = 0;
};

} // namespace sqlgate
