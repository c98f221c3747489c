#include "remote/envelope.hpp"
#include "core/json.hpp"

#include <optional>
#include <variant>

namespace sqlgate::envelope {

namespace {

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

RemoteFailure malformed(int status) {
    return {RemoteFailureKind::TRANSPORT, status, std::string(kMalformedEnvelope), {}};
}

/// Collect errors[].message (string entries are accepted as-is).
std::vector<std::string> collect_messages(const json::Json& root) {
    std::vector<std::string> messages;
    const auto* errors = json::field(root, "errors");
    if (!errors || !errors->is_array()) return messages;
    for (const auto& entry : errors->get_array()) {
        if (entry.is_string()) {
            messages.push_back(entry.get<std::string>());
        } else if (auto msg = json::string_field(entry, "message")) {
            messages.push_back(std::move(*msg));
        }
    }
    return messages;
}

/**
 * Shared prelude: status check, JSON parse, success flag.
 * Returns the parsed root on success:true, a failure otherwise.
 */
RemoteResult<json::Json> open_envelope(int status, std::string_view reason,
                                       std::string_view body) {
    if (!is_success_status(status)) {
        return RemoteResult<json::Json>::failure(
            RemoteFailure::transport(status, std::string(reason)));
    }

    auto root = json::parse(body);
    if (!root || !root->is_object()) {
        return RemoteResult<json::Json>::failure(malformed(status));
    }

    const auto success = json::bool_field(*root, "success");
    if (!success) {
        return RemoteResult<json::Json>::failure(malformed(status));
    }
    if (!*success) {
        return RemoteResult<json::Json>::failure(
            RemoteFailure::application(collect_messages(*root)));
    }
    return RemoteResult<json::Json>::ok(std::move(*root));
}

std::optional<int64_t> counter(const json::Json& result, std::string_view key) {
    if (auto v = json::int_field(result, key)) return v;
    if (const auto* meta = json::field(result, "meta")) {
        return json::int_field(*meta, key);
    }
    return std::nullopt;
}

/// Re-reads result.results from the raw body so each row keeps the remote
/// column order. `wrapped` means result arrived as a one-element array.
std::optional<std::vector<Row>> ordered_rows(std::string_view body, bool wrapped) {
    auto result_text = json::member_text(body, "result");
    if (result_text && wrapped) {
        result_text = json::first_element_text(*result_text);
    }
    if (!result_text) return std::nullopt;

    const auto rows_text = json::member_text(*result_text, "results");
    if (!rows_text) return std::nullopt;
    return json::rows_from_text(*rows_text);
}

} // anonymous namespace

// ============================================================================
// Query response
// ============================================================================

RemoteResult<ExecutionResult> decode_query_response(
    int status, std::string_view reason, std::string_view body) {
    auto opened = open_envelope(status, reason, body);
    if (!opened.is_ok()) {
        return RemoteResult<ExecutionResult>::failure(opened.failure());
    }
    const auto& root = opened.value();

    ExecutionResult out;
    const auto* result = json::field(root, "result");
    if (!result || result->is_null()) {
        return RemoteResult<ExecutionResult>::ok(std::move(out));
    }

    // One statement per request: the live API wraps its result in an array.
    const bool wrapped = result->is_array();
    if (wrapped) {
        const auto& arr = result->get_array();
        if (arr.empty()) {
            return RemoteResult<ExecutionResult>::ok(std::move(out));
        }
        result = &arr.front();
    }
    if (!result->is_object()) {
        return RemoteResult<ExecutionResult>::failure(malformed(status));
    }

    if (const auto* rows = json::field(*result, "results")) {
        if (!rows->is_array()) {
            return RemoteResult<ExecutionResult>::failure(malformed(status));
        }
        auto ordered = ordered_rows(body, wrapped);
        if (!ordered) {
            return RemoteResult<ExecutionResult>::failure(malformed(status));
        }
        out.rows = std::move(*ordered);
    }

    out.elapsed_ms = counter(*result, "duration");
    out.changed_row_count = counter(*result, "changes");
    out.total_count = counter(*result, "count");
    return RemoteResult<ExecutionResult>::ok(std::move(out));
}

// ============================================================================
// Database list
// ============================================================================

RemoteResult<std::vector<DatabaseInfo>> decode_database_list(
    int status, std::string_view reason, std::string_view body) {
    auto opened = open_envelope(status, reason, body);
    if (!opened.is_ok()) {
        return RemoteResult<std::vector<DatabaseInfo>>::failure(opened.failure());
    }

    std::vector<DatabaseInfo> databases;
    const auto* result = json::field(opened.value(), "result");
    if (!result || result->is_null()) {
        return RemoteResult<std::vector<DatabaseInfo>>::ok(std::move(databases));
    }
    if (!result->is_array()) {
        return RemoteResult<std::vector<DatabaseInfo>>::failure(malformed(status));
    }

    for (const auto& item : result->get_array()) {
        auto uuid = json::string_field(item, "uuid");
        if (!uuid || uuid->empty()) continue;
        DatabaseInfo info;
        info.id = std::move(*uuid);
        info.name = json::string_field(item, "name").value_or(info.id);
        info.created_at = json::string_field(item, "created_at").value_or("");
        info.version = json::string_field(item, "version").value_or("");
        info.region = json::string_field(item, "running_in_region").value_or("");
        databases.push_back(std::move(info));
    }
    return RemoteResult<std::vector<DatabaseInfo>>::ok(std::move(databases));
}

// ============================================================================
// Schema rows
// ============================================================================

SchemaDescriptor schema_from_rows(const std::vector<Row>& rows) {
    SchemaDescriptor schema;
    schema.reserve(rows.size());
    for (const auto& row : rows) {
        const auto* name = row.find("name");
        const auto* type = row.find("type");
        if (!name || !type) continue;
        const auto* name_str = std::get_if<std::string>(name);
        const auto* type_str = std::get_if<std::string>(type);
        if (!name_str || !type_str) continue;

        SchemaObject obj;
        obj.name = *name_str;
        if (*type_str == "table") {
            obj.kind = SchemaObjectKind::TABLE;
        } else if (*type_str == "view") {
            obj.kind = SchemaObjectKind::VIEW;
        } else {
            continue;
        }
        if (const auto* sql = row.find("sql")) {
            if (const auto* text = std::get_if<std::string>(sql)) {
                obj.definition = *text;
            }
        }
        schema.push_back(std::move(obj));
    }
    return schema;
}

} // namespace sqlgate::envelope
