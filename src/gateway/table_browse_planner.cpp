#include "gateway/table_browse_planner.hpp"
#include "gateway/outcome_record.hpp"
#include "classifier/error_classifier.hpp"
#include "credentials/credential_store.hpp"
#include "remote/iremote_sql_client.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace sqlgate {

TableBrowsePlanner::TableBrowsePlanner(std::shared_ptr<IRemoteSqlClient> client,
                                       std::shared_ptr<ICredentialStore> credentials,
                                       std::shared_ptr<ErrorClassifier> classifier)
    : TableBrowsePlanner(std::move(client), std::move(credentials),
                         std::move(classifier), Config{}) {}

TableBrowsePlanner::TableBrowsePlanner(std::shared_ptr<IRemoteSqlClient> client,
                                       std::shared_ptr<ICredentialStore> credentials,
                                       std::shared_ptr<ErrorClassifier> classifier,
                                       Config config)
    : client_(std::move(client)),
      credentials_(std::move(credentials)),
      classifier_(std::move(classifier)),
      config_(config) {}

std::string TableBrowsePlanner::quote_identifier(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 2);
    out += '"';
    for (const char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string TableBrowsePlanner::build_select(std::string_view table_name,
                                             int64_t limit, int64_t offset) {
    return std::format("SELECT * FROM {} LIMIT {} OFFSET {}",
                       quote_identifier(table_name), limit, offset);
}

std::optional<GatewayError> TableBrowsePlanner::validate_paging(
    int64_t limit, int64_t offset, int64_t max_limit) {
    if (limit < 1 || limit > max_limit) {
        return GatewayError::validation(
            std::format("Limit must be a number between 1 and {}", max_limit));
    }
    if (offset < 0) {
        return GatewayError::validation("Offset must be a non-negative number");
    }
    return std::nullopt;
}

GatewayError TableBrowsePlanner::classify_failure(const RemoteFailure& failure) const {
    return classifier_->classify(failure).to_gateway_error();
}

// ============================================================================
// plan_and_execute
// ============================================================================

Result<BrowsePage> TableBrowsePlanner::plan_and_execute(const TableBrowseRequest& request) {
    requests_.fetch_add(1, std::memory_order_relaxed);
    const utils::Timer timer;

    OutcomeRecord record;
    record.operation = OutcomeOperation::TABLE_ROWS;
    record.database_id = request.database_id;
    record.table_name = request.table_name;

    const auto fail = [&](GatewayError err) {
        record.elapsed_ms = timer.elapsed_ms().count();
        record.error_kind = err.kind;
        record.error_message = err.message;
        emit_outcome(record);
        return Result<BrowsePage>::error(std::move(err));
    };

    if (auto invalid = validate_paging(request.limit, request.offset, config_.max_limit)) {
        validation_rejections_.fetch_add(1, std::memory_order_relaxed);
        return fail(std::move(*invalid));
    }
    if (request.database_id.empty() || request.table_name.empty()) {
        validation_rejections_.fetch_add(1, std::memory_order_relaxed);
        return fail(GatewayError::validation("Database id and table name are required"));
    }

    const auto credential = credentials_->get_active();
    if (!credential) {
        return fail(GatewayError::no_active_credential());
    }

    remote_calls_.fetch_add(1, std::memory_order_relaxed);
    auto schema = client_->describe_schema(*credential, request.database_id);
    if (!schema.is_ok()) {
        return fail(classify_failure(schema.failure()));
    }

    // Only the schema's own spelling of the name reaches the SQL text
    const auto& objects = schema.value();
    const auto it = std::find_if(objects.begin(), objects.end(),
        [&](const SchemaObject& obj) {
            return obj.kind == SchemaObjectKind::TABLE && obj.name == request.table_name;
        });
    if (it == objects.end()) {
        tables_not_found_.fetch_add(1, std::memory_order_relaxed);
        return fail(GatewayError::table_not_found(request.table_name));
    }

    const auto sql = build_select(it->name, request.limit, request.offset);

    remote_calls_.fetch_add(1, std::memory_order_relaxed);
    auto remote = client_->execute(*credential, request.database_id, sql);
    if (!remote.is_ok()) {
        return fail(classify_failure(remote.failure()));
    }

    BrowsePage page;
    page.row_count = static_cast<int64_t>(remote.value().rows.size());
    page.page_size = request.limit;
    page.rows = std::move(remote.value().rows);

    record.elapsed_ms = timer.elapsed_ms().count();
    record.row_count = page.row_count;
    record.page_size = request.limit;
    record.offset = request.offset;
    emit_outcome(record);
    return Result<BrowsePage>::ok(std::move(page));
}

TableBrowsePlanner::Stats TableBrowsePlanner::get_stats() const {
    return {
        requests_.load(std::memory_order_relaxed),
        validation_rejections_.load(std::memory_order_relaxed),
        tables_not_found_.load(std::memory_order_relaxed),
        remote_calls_.load(std::memory_order_relaxed)
    };
}

} // namespace sqlgate
