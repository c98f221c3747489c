#include "gateway/query_gateway.hpp"
#include "gateway/outcome_record.hpp"
#include "cache/result_cache.hpp"
#include "catalog/database_registry.hpp"
#include "classifier/error_classifier.hpp"
#include "credentials/credential_store.hpp"
#include "parser/fingerprinter.hpp"
#include "remote/iremote_sql_client.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlgate {

QueryGateway::QueryGateway(std::shared_ptr<IRemoteSqlClient> client,
                           std::shared_ptr<ICredentialStore> credentials,
                           std::shared_ptr<ResultCache> cache,
                           std::shared_ptr<ErrorClassifier> classifier,
                           std::shared_ptr<DatabaseRegistry> registry)
    : client_(std::move(client)),
      credentials_(std::move(credentials)),
      cache_(std::move(cache)),
      classifier_(std::move(classifier)),
      registry_(std::move(registry)) {}

GatewayError QueryGateway::classify_failure(const RemoteFailure& failure) {
    auto err = classifier_->classify(failure).to_gateway_error();
    if (err.kind == ErrorKind::USER) {
        user_errors_.fetch_add(1, std::memory_order_relaxed);
    } else {
        system_errors_.fetch_add(1, std::memory_order_relaxed);
    }
    return err;
}

// ============================================================================
// run_query
// ============================================================================

Result<ExecutionOutcome> QueryGateway::run_query(const QueryRequest& request) {
    requests_.fetch_add(1, std::memory_order_relaxed);
    const utils::Timer timer;

    OutcomeRecord record;
    record.operation = OutcomeOperation::QUERY;
    record.database_id = request.database_id;

    const auto fail = [&](GatewayError err) {
        record.elapsed_ms = timer.elapsed_ms().count();
        record.error_kind = err.kind;
        record.error_message = err.message;
        emit_outcome(record);
        return Result<ExecutionOutcome>::error(std::move(err));
    };

    if (request.sql_text.empty()) {
        return fail(GatewayError::validation("Query is required"));
    }
    if (request.database_id.empty()) {
        return fail(GatewayError::validation("Database id is required"));
    }

    const auto credential = credentials_->get_active();
    if (!credential) {
        return fail(GatewayError::no_active_credential());
    }

    record.fingerprint = QueryFingerprinter::fingerprint(request.sql_text);

    if (auto cached = cache_->get(record.fingerprint, request.database_id)) {
        cache_hits_.fetch_add(1, std::memory_order_relaxed);
        ExecutionOutcome outcome;
        outcome.rows = std::move(cached->rows);
        outcome.row_count = cached->row_count;
        outcome.elapsed_ms = cached->elapsed_ms;
        outcome.from_cache = true;

        record.elapsed_ms = timer.elapsed_ms().count();
        record.row_count = outcome.row_count;
        record.from_cache = true;
        emit_outcome(record);
        return Result<ExecutionOutcome>::ok(std::move(outcome));
    }

    remote_calls_.fetch_add(1, std::memory_order_relaxed);
    auto remote = client_->execute(*credential, request.database_id, request.sql_text);
    if (!remote.is_ok()) {
        return fail(classify_failure(remote.failure()));
    }

    auto& result = remote.value();
    ExecutionOutcome outcome;
    outcome.row_count = static_cast<int64_t>(result.rows.size());
    outcome.changed_row_count = result.changed_row_count;
    outcome.elapsed_ms = timer.elapsed_ms().count();
    outcome.rows = std::move(result.rows);

    cache_->put(record.fingerprint, request.database_id,
                outcome.rows, outcome.row_count, outcome.elapsed_ms);

    record.elapsed_ms = outcome.elapsed_ms;
    record.row_count = outcome.row_count;
    emit_outcome(record);
    return Result<ExecutionOutcome>::ok(std::move(outcome));
}

// ============================================================================
// Discovery
// ============================================================================

Result<std::vector<DatabaseInfo>> QueryGateway::list_databases() {
    const auto credential = credentials_->get_active();
    if (!credential) {
        return Result<std::vector<DatabaseInfo>>::error(GatewayError::no_active_credential());
    }

    remote_calls_.fetch_add(1, std::memory_order_relaxed);
    auto remote = client_->list_databases(*credential);
    if (!remote.is_ok()) {
        auto err = classify_failure(remote.failure());
        utils::log::error(std::format("[DATABASES {}] {}",
            error_kind_to_string(err.kind), err.message));
        return Result<std::vector<DatabaseInfo>>::error(std::move(err));
    }

    if (registry_) {
        for (const auto& db : remote.value()) {
            registry_->upsert(db, credential->account_id);
        }
    }
    return Result<std::vector<DatabaseInfo>>::ok(std::move(remote.value()));
}

Result<SchemaDescriptor> QueryGateway::describe_schema(const std::string& database_id) {
    if (database_id.empty()) {
        return Result<SchemaDescriptor>::error(
            GatewayError::validation("Database id is required"));
    }
    const auto credential = credentials_->get_active();
    if (!credential) {
        return Result<SchemaDescriptor>::error(GatewayError::no_active_credential());
    }

    remote_calls_.fetch_add(1, std::memory_order_relaxed);
    auto remote = client_->describe_schema(*credential, database_id);
    if (!remote.is_ok()) {
        auto err = classify_failure(remote.failure());
        utils::log::error(std::format("[SCHEMA {}] dbId={} {}",
            error_kind_to_string(err.kind), database_id, err.message));
        return Result<SchemaDescriptor>::error(std::move(err));
    }
    return Result<SchemaDescriptor>::ok(std::move(remote.value()));
}

QueryGateway::Stats QueryGateway::get_stats() const {
    return {
        requests_.load(std::memory_order_relaxed),
        cache_hits_.load(std::memory_order_relaxed),
        remote_calls_.load(std::memory_order_relaxed),
        user_errors_.load(std::memory_order_relaxed),
        system_errors_.load(std::memory_order_relaxed)
    };
}

} // namespace sqlgate
