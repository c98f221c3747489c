#include "gateway/outcome_record.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace sqlgate {

namespace {

const char* status_suffix(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                 return "SUCCESS";
        case ErrorKind::VALIDATION:
        case ErrorKind::TABLE_NOT_FOUND:
        case ErrorKind::NO_ACTIVE_CREDENTIAL:
        case ErrorKind::USER:                 return "USER_ERROR";
        case ErrorKind::SYSTEM:               return "SYSTEM_ERROR";
        case ErrorKind::UNKNOWN:
        default:                              return "UNKNOWN_ERROR";
    }
}

} // anonymous namespace

std::string OutcomeRecord::tag() const {
    const char* op = (operation == OutcomeOperation::QUERY) ? "QUERY" : "TABLE_ROWS";
    return std::format("[{} {}]", op, status_suffix(error_kind));
}

std::string OutcomeRecord::to_json() const {
    json::Json j = json::make_object();
    j["dbId"] = database_id;
    if (operation == OutcomeOperation::QUERY) {
        j["queryHash"] = fingerprint;
    } else {
        j["tableName"] = table_name;
    }
    j["duration"] = utils::format_millis(elapsed_ms);
    if (error_kind == ErrorKind::NONE) {
        j["rowCount"] = static_cast<double>(row_count);
        if (operation == OutcomeOperation::QUERY) {
            j["cached"] = from_cache;
        }
        if (page_size) j["pageSize"] = static_cast<double>(*page_size);
        if (offset) j["offset"] = static_cast<double>(*offset);
    } else {
        j["errorType"] = std::string(error_kind_to_string(error_kind));
        j["errorMessage"] = error_message;
    }
    j["timestamp"] = utils::format_timestamp(timestamp);
    return json::dump(j);
}

void emit_outcome(const OutcomeRecord& record) {
    try {
        const auto line = std::format("{} {}", record.tag(), record.to_json());
        if (http_status_for(record.error_kind) >= 500) {
            utils::log::error(line);
        } else {
            utils::log::info(line);
        }
    } catch (const std::exception& e) {
        // Observability must not fail the request
        utils::log::warn(std::format("Failed to emit outcome record: {}", e.what()));
    }
}

} // namespace sqlgate
