#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sqlgate {

/**
 * @brief Error taxonomy of the gateway
 *
 * VALIDATION / TABLE_NOT_FOUND / NO_ACTIVE_CREDENTIAL are raised before any
 * SQL reaches the remote service. USER and SYSTEM come only from the error
 * classifier. UNKNOWN covers anything that escaped the typed paths.
 */
enum class ErrorKind {
    NONE,
    VALIDATION,
    TABLE_NOT_FOUND,
    NO_ACTIVE_CREDENTIAL,
    USER,
    SYSTEM,
    UNKNOWN
};

[[nodiscard]] inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                 return "None";
        case ErrorKind::VALIDATION:           return "ValidationError";
        case ErrorKind::TABLE_NOT_FOUND:      return "TableNotFound";
        case ErrorKind::NO_ACTIVE_CREDENTIAL: return "NoActiveCredential";
        case ErrorKind::USER:                 return "UserError";
        case ErrorKind::SYSTEM:               return "SystemError";
        case ErrorKind::UNKNOWN:              return "UnknownError";
        default:                              return "UnknownError";
    }
}

/// HTTP status code an error kind maps to (200 for NONE).
[[nodiscard]] inline int http_status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:
            return 200;
        case ErrorKind::VALIDATION:
        case ErrorKind::TABLE_NOT_FOUND:
        case ErrorKind::NO_ACTIVE_CREDENTIAL:
        case ErrorKind::USER:
            return 400;
        case ErrorKind::SYSTEM:
        case ErrorKind::UNKNOWN:
        default:
            return 500;
    }
}

/**
 * @brief A failure as seen by gateway callers
 *
 * For SYSTEM/UNKNOWN the message is server-side detail only; use
 * public_message() for anything that leaves the process.
 */
struct GatewayError {
    ErrorKind kind = ErrorKind::NONE;
    std::string message;
    std::optional<int> status_code;
    std::vector<std::string> raw_details;

    static GatewayError validation(std::string msg) {
        return {ErrorKind::VALIDATION, std::move(msg), std::nullopt, {}};
    }

    static GatewayError table_not_found(const std::string& table) {
        return {ErrorKind::TABLE_NOT_FOUND,
                "Table '" + table + "' does not exist", std::nullopt, {}};
    }

    static GatewayError no_active_credential() {
        return {ErrorKind::NO_ACTIVE_CREDENTIAL,
                "No active API key configured", std::nullopt, {}};
    }
};

/// Message safe to show to the end user: pass-through for caller-caused
/// errors, the generic fallback otherwise.
[[nodiscard]] inline std::string public_message(const GatewayError& error,
                                                const std::string& system_fallback,
                                                const std::string& unknown_fallback) {
    switch (error.kind) {
        case ErrorKind::SYSTEM:  return system_fallback;
        case ErrorKind::UNKNOWN: return unknown_fallback;
        default:                 return error.message;
    }
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(GatewayError err) {
        Result r;
        r.success_ = false;
        r.error_ = std::move(err);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const GatewayError& error() const { return error_; }
    ErrorKind error_kind() const { return error_.kind; }
    const std::string& error_message() const { return error_.message; }

private:
    bool success_ = false;
    std::optional<T> value_;
    GatewayError error_;
};

} // namespace sqlgate
