#pragma once

#include "core/error.hpp"
#include "remote/remote_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sqlgate {

enum class ErrorClass : uint8_t {
    USER,      // the statement itself is malformed or violates the schema
    SYSTEM     // authentication, transport, capacity, or unrecognized
};

struct ClassifiedError {
    ErrorClass error_class = ErrorClass::SYSTEM;
    std::string message;
    std::optional<int> status_code;        // SYSTEM only
    std::vector<std::string> raw_details;

    [[nodiscard]] bool is_user_error() const { return error_class == ErrorClass::USER; }

    /// Gateway-level view (USER → ErrorKind::USER, SYSTEM → ErrorKind::SYSTEM)
    [[nodiscard]] GatewayError to_gateway_error() const;
};

/**
 * @brief Remote failure → UserError | SystemError
 *
 * The remote service only emits free-text messages, so APPLICATION failures
 * are matched against a signature list:
 * 1. Any message containing any single signature → USER
 * 2. Any message containing every term of a conjunction → USER
 * 3. Otherwise → SYSTEM
 * TRANSPORT and AUTHENTICATION failures are always SYSTEM, whatever the text.
 *
 * Matching is case-insensitive (messages are lowercased; signatures are
 * expected lowercase). classify() is pure and thread-safe.
 */
class ErrorClassifier {
public:
    struct Config {
        std::vector<std::string> signatures = default_signatures();
        std::vector<std::vector<std::string>> conjunctions = default_conjunctions();
    };

    ErrorClassifier();
    explicit ErrorClassifier(Config config);

    [[nodiscard]] ClassifiedError classify(const RemoteFailure& failure) const;

    /// True if the messages, joined with ", ", match a signature or conjunction.
    [[nodiscard]] bool matches_user_signature(const std::vector<std::string>& messages) const;

    [[nodiscard]] static std::vector<std::string> default_signatures();
    [[nodiscard]] static std::vector<std::vector<std::string>> default_conjunctions();

private:
    [[nodiscard]] bool message_matches(const std::string& lowered) const;

    Config config_;
};

} // namespace sqlgate
