#include "server/api_handler.hpp"
#include "server/http_constants.hpp"
#include "classifier/error_classifier.hpp"
#include "credentials/credential_store.hpp"
#include "export/csv_exporter.hpp"
#include "gateway/outcome_record.hpp"
#include "gateway/query_gateway.hpp"
#include "gateway/table_browse_planner.hpp"
#include "remote/iremote_sql_client.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlgate {

namespace {

std::string failure_message(const GatewayError& error, const std::string& fallback) {
    return public_message(error, fallback, fallback);
}

json::Json redacted(const CredentialRecord& record) {
    json::Json j = json::make_object();
    j["id"] = record.id;
    j["name"] = record.name;
    j["accountId"] = record.account_id;
    j["isActive"] = record.active;
    j["createdAt"] = utils::format_timestamp(record.created_at);
    return j;
}

json::Json database_to_json(const DatabaseInfo& db) {
    json::Json j = json::make_object();
    j["id"] = db.id;
    j["uuid"] = db.id;
    j["name"] = db.name;
    j["created_at"] = db.created_at;
    j["version"] = db.version;
    j["running_in_region"] = db.region;
    return j;
}

json::Json schema_object_to_json(const SchemaObject& obj) {
    json::Json j = json::make_object();
    j["name"] = obj.name;
    j["type"] = std::string(schema_object_kind_to_string(obj.kind));
    j["sql"] = obj.definition;
    return j;
}

/// Records a failure that escaped the typed paths and returns it as UNKNOWN
GatewayError unknown_error(OutcomeOperation operation, const std::string& database_id,
                           const std::string& table_name, int64_t elapsed_ms,
                           const std::string& detail) {
    OutcomeRecord record;
    record.operation = operation;
    record.database_id = database_id;
    record.table_name = table_name;
    record.elapsed_ms = elapsed_ms;
    record.error_kind = ErrorKind::UNKNOWN;
    record.error_message = detail;
    emit_outcome(record);
    return {ErrorKind::UNKNOWN, detail, std::nullopt, {}};
}

/// Header values must not break out of the Content-Disposition line
std::string sanitize_filename(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (const char c : name) {
        if (c == '\r' || c == '\n' || c == '"' || c == ';') continue;
        out += c;
    }
    return out;
}

} // anonymous namespace

ApiHandler::ApiHandler(std::shared_ptr<IRemoteSqlClient> client,
                       std::shared_ptr<CredentialStore> credentials,
                       std::shared_ptr<ErrorClassifier> classifier,
                       std::shared_ptr<QueryGateway> gateway,
                       std::shared_ptr<TableBrowsePlanner> planner,
                       Config config)
    : client_(std::move(client)),
      credentials_(std::move(credentials)),
      classifier_(std::move(classifier)),
      gateway_(std::move(gateway)),
      planner_(std::move(planner)),
      config_(config) {}

ApiResponse ApiHandler::message_response(int status, const std::string& message) {
    json::Json j = json::make_object();
    j["message"] = message;
    return ApiResponse::json(status, json::dump(j));
}

ApiResponse ApiHandler::health() const {
    return ApiResponse::json(200, R"({"status":"ok"})");
}

// ============================================================================
// Query
// ============================================================================

ApiResponse ApiHandler::query_failure(const GatewayError& error, int64_t elapsed_ms) const {
    json::Json j = json::make_object();
    j["message"] = public_message(error, http::kQuerySystemMessage, http::kQueryUnknownMessage);
    j["results"] = json::make_array();
    j["rowCount"] = 0.0;
    j["executionTime"] = utils::format_millis(elapsed_ms);
    return ApiResponse::json(http_status_for(error.kind), json::dump(j));
}

ApiResponse ApiHandler::run_query(const std::string& database_id, const std::string& body) {
    const utils::Timer timer;

    if (body.size() > config_.max_body_length) {
        return query_failure(GatewayError::validation(
            std::format("SQL too long: max {} bytes", config_.max_body_length)), 0);
    }

    const auto parsed = json::parse(body);
    if (!parsed || !parsed->is_object()) {
        return query_failure(GatewayError::validation("Invalid JSON: empty or malformed"), 0);
    }

    // Clients send the statement as "query"; "sql" is accepted as well
    auto sql = json::string_field(*parsed, "query");
    if (!sql) sql = json::string_field(*parsed, "sql");

    try {
        const auto result = gateway_->run_query({database_id, sql.value_or("")});
        if (result.is_error()) {
            return query_failure(result.error(), timer.elapsed_ms().count());
        }

        const auto& outcome = result.value();
        json::Json j = json::make_object();
        j["executionTime"] = utils::format_millis(outcome.elapsed_ms);
        j["rowCount"] = static_cast<double>(outcome.row_count);
        if (outcome.changed_row_count) {
            j["changes"] = static_cast<double>(*outcome.changed_row_count);
        }
        j["cached"] = outcome.from_cache;
        return ApiResponse::json(200, json::dump_with_rows("results", outcome.rows, j));
    } catch (const std::exception& e) {
        const auto err = unknown_error(OutcomeOperation::QUERY, database_id, "",
                                       timer.elapsed_ms().count(), e.what());
        return query_failure(err, timer.elapsed_ms().count());
    }
}

// ============================================================================
// Table rows
// ============================================================================

ApiResponse ApiHandler::rows_failure(const GatewayError& error, int64_t page_size) const {
    json::Json j = json::make_object();
    j["message"] = public_message(error, http::kBrowseSystemMessage, http::kBrowseUnknownMessage);
    j["rows"] = json::make_array();
    j["rowCount"] = 0.0;
    j["pageSize"] = static_cast<double>(page_size);
    return ApiResponse::json(http_status_for(error.kind), json::dump(j));
}

ApiResponse ApiHandler::table_rows(const std::string& database_id,
                                   const std::string& table_name,
                                   const std::optional<std::string>& limit,
                                   const std::optional<std::string>& offset) {
    TableBrowseRequest request;
    request.database_id = database_id;
    request.table_name = table_name;
    request.limit = config_.default_limit;
    request.offset = 0;

    if (limit) {
        const auto n = utils::try_parse_int<int64_t>(utils::trim(*limit));
        if (!n) {
            return rows_failure(GatewayError::validation(
                std::format("Limit must be a number between 1 and {}", config_.max_limit)), 0);
        }
        request.limit = *n;
    }
    if (offset) {
        const auto n = utils::try_parse_int<int64_t>(utils::trim(*offset));
        if (!n) {
            return rows_failure(
                GatewayError::validation("Offset must be a non-negative number"), 0);
        }
        request.offset = *n;
    }

    const utils::Timer timer;
    try {
        const auto result = planner_->plan_and_execute(request);
        if (result.is_error()) {
            const auto& err = result.error();
            const int64_t page_size = (err.kind == ErrorKind::VALIDATION) ? 0 : request.limit;
            return rows_failure(err, page_size);
        }

        const auto& page = result.value();
        json::Json j = json::make_object();
        j["rowCount"] = static_cast<double>(page.row_count);
        j["pageSize"] = static_cast<double>(page.page_size);
        return ApiResponse::json(200, json::dump_with_rows("rows", page.rows, j));
    } catch (const std::exception& e) {
        const auto err = unknown_error(OutcomeOperation::TABLE_ROWS, database_id, table_name,
                                       timer.elapsed_ms().count(), e.what());
        return rows_failure(err, request.limit);
    }
}

// ============================================================================
// Discovery
// ============================================================================

ApiResponse ApiHandler::list_databases() {
    const auto result = gateway_->list_databases();
    if (result.is_error()) {
        return message_response(http_status_for(result.error_kind()),
                                failure_message(result.error(), "Failed to fetch databases"));
    }

    json::Json::array_t arr;
    arr.reserve(result.value().size());
    for (const auto& db : result.value()) {
        arr.push_back(database_to_json(db));
    }
    json::Json j;
    j = std::move(arr);
    return ApiResponse::json(200, json::dump(j));
}

ApiResponse ApiHandler::describe_schema(const std::string& database_id) {
    const auto result = gateway_->describe_schema(database_id);
    if (result.is_error()) {
        return message_response(http_status_for(result.error_kind()),
                                failure_message(result.error(), "Failed to fetch database schema"));
    }

    json::Json::array_t arr;
    arr.reserve(result.value().size());
    for (const auto& obj : result.value()) {
        arr.push_back(schema_object_to_json(obj));
    }
    json::Json j;
    j = std::move(arr);
    return ApiResponse::json(200, json::dump(j));
}

// ============================================================================
// Credentials
// ============================================================================

ApiResponse ApiHandler::create_api_key(const std::string& body) {
    const auto parsed = json::parse(body);
    if (!parsed || !parsed->is_object()) {
        return message_response(400, "Invalid JSON: empty or malformed");
    }

    const auto name = json::string_field(*parsed, "name");
    const auto account_id = json::string_field(*parsed, "accountId");
    const auto token = json::string_field(*parsed, "cloudflareToken");
    if (!name || name->empty() || !account_id || account_id->empty() ||
        !token || token->empty()) {
        return message_response(400, "name, accountId and cloudflareToken are required");
    }

    // The candidate must be able to list databases before it becomes active
    const CredentialSet candidate{*account_id, *token};
    const auto probe = client_->list_databases(candidate);
    if (!probe.is_ok()) {
        const auto& failure = probe.failure();
        const auto err = classifier_->classify(failure).to_gateway_error();
        utils::log::warn(std::format("API key validation failed for account {}: {}",
                                     *account_id, err.message));
        if (failure.kind == RemoteFailureKind::AUTHENTICATION) {
            return message_response(400, "Invalid account id or API token");
        }
        return message_response(400, failure_message(err, "Failed to create API key"));
    }

    const auto record = credentials_->add(*name, *account_id, *token);
    utils::log::info(std::format("API key '{}' added and activated (id={})",
                                 record.name, record.id));
    return ApiResponse::json(200, json::dump(redacted(record)));
}

ApiResponse ApiHandler::list_api_keys() const {
    json::Json::array_t arr;
    for (const auto& record : credentials_->list()) {
        arr.push_back(redacted(record));
    }
    json::Json j;
    j = std::move(arr);
    return ApiResponse::json(200, json::dump(j));
}

ApiResponse ApiHandler::delete_api_key(const std::string& id) {
    if (!credentials_->remove(id)) {
        return message_response(404, "API key not found");
    }
    utils::log::info(std::format("API key removed (id={})", id));
    return ApiResponse::json(200, R"({"success":true})");
}

// ============================================================================
// Export
// ============================================================================

ApiResponse ApiHandler::export_data(const std::string& body) const {
    const auto parsed = json::parse(body);
    if (!parsed || !parsed->is_object()) {
        return message_response(400, "Invalid JSON: empty or malformed");
    }

    const auto* data = json::field(*parsed, "data");
    if (!data || !data->is_array()) {
        return message_response(400, "Export data must be an array");
    }
    const auto format = json::string_field(*parsed, "format").value_or("");
    const auto filename = sanitize_filename(json::string_field(*parsed, "filename").value_or(""));

    // The DOM above sorts object members; the raw text keeps the caller's key order
    const auto data_text = json::member_text(body, "data");
    if (!data_text) {
        return message_response(400, "Export data must be an array");
    }

    ApiResponse response;
    if (format == "csv") {
        const auto rows = json::rows_from_text(*data_text);
        if (!rows) {
            return message_response(400, "Export data must be an array of objects");
        }
        response.body = CsvExporter::to_csv(*rows);
        response.content_type = http::kCsvContentType;
        response.headers.emplace_back("Content-Disposition", std::format(
            "attachment; filename={}", filename.empty() ? "export.csv" : filename));
    } else if (format == "json") {
        response.body = *data_text;
        response.content_type = http::kJsonContentType;
        response.headers.emplace_back("Content-Disposition", std::format(
            "attachment; filename={}", filename.empty() ? "export.json" : filename));
    } else {
        return message_response(400, "Unsupported format");
    }
    return response;
}

} // namespace sqlgate
