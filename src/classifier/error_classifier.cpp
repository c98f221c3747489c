#include "classifier/error_classifier.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace sqlgate {

// ============================================================================
// ClassifiedError
// ============================================================================

GatewayError ClassifiedError::to_gateway_error() const {
    GatewayError err;
    err.kind = is_user_error() ? ErrorKind::USER : ErrorKind::SYSTEM;
    err.message = message;
    err.status_code = status_code;
    err.raw_details = raw_details;
    return err;
}

// ============================================================================
// Signature lists
// ============================================================================

std::vector<std::string> ErrorClassifier::default_signatures() {
    return {
        "syntax error",
        "no such table",
        "no such column",
        "near ",            // parser token-position marker: near "SELET"
        "sql error",
        "parse error",
        "duplicate column",
        "constraint",
    };
}

std::vector<std::vector<std::string>> ErrorClassifier::default_conjunctions() {
    return {
        {"table", "already exists"},
    };
}

// ============================================================================
// Construction
// ============================================================================

ErrorClassifier::ErrorClassifier()
    : ErrorClassifier(Config{}) {}

ErrorClassifier::ErrorClassifier(Config config)
    : config_(std::move(config)) {
    for (auto& sig : config_.signatures) {
        sig = utils::to_lower(sig);
    }
    for (auto& terms : config_.conjunctions) {
        for (auto& term : terms) {
            term = utils::to_lower(term);
        }
    }
    // An empty pattern would match every message
    std::erase_if(config_.signatures, [](const std::string& s) { return s.empty(); });
    std::erase_if(config_.conjunctions, [](const std::vector<std::string>& terms) {
        return terms.empty() ||
               std::any_of(terms.begin(), terms.end(),
                           [](const std::string& t) { return t.empty(); });
    });
}

// ============================================================================
// Matching
// ============================================================================

bool ErrorClassifier::message_matches(const std::string& lowered) const {
    for (const auto& sig : config_.signatures) {
        if (lowered.find(sig) != std::string::npos) return true;
    }
    for (const auto& terms : config_.conjunctions) {
        const bool all = std::all_of(terms.begin(), terms.end(),
            [&lowered](const std::string& term) {
                return lowered.find(term) != std::string::npos;
            });
        if (all) return true;
    }
    return false;
}

bool ErrorClassifier::matches_user_signature(const std::vector<std::string>& messages) const {
    // Matched against the same joined text the caller sees, so a conjunction
    // may draw its terms from different messages
    return message_matches(utils::to_lower(utils::join(messages, ", ")));
}

// ============================================================================
// classify
// ============================================================================

ClassifiedError ErrorClassifier::classify(const RemoteFailure& failure) const {
    ClassifiedError out;

    switch (failure.kind) {
        case RemoteFailureKind::AUTHENTICATION:
            out.error_class = ErrorClass::SYSTEM;
            out.status_code = failure.status_code;
            out.message = std::format("Remote authentication failed: HTTP {} {}",
                                      failure.status_code, failure.status_text);
            out.raw_details = {failure.status_text};
            return out;

        case RemoteFailureKind::TRANSPORT:
            out.error_class = ErrorClass::SYSTEM;
            if (failure.status_code != 0) {
                out.status_code = failure.status_code;
                out.message = std::format("Remote request failed: HTTP {} {}",
                                          failure.status_code, failure.status_text);
            } else {
                out.message = std::format("Remote request failed: {}", failure.status_text);
            }
            out.raw_details = {failure.status_text};
            return out;

        case RemoteFailureKind::APPLICATION:
        default:
            break;
    }

    out.raw_details = failure.messages;
    if (matches_user_signature(failure.messages)) {
        out.error_class = ErrorClass::USER;
        out.message = utils::join(failure.messages, ", ");
    } else {
        out.error_class = ErrorClass::SYSTEM;
        out.message = failure.messages.empty()
            ? std::string("Remote service reported failure without detail")
            : std::format("Remote service error: {}", utils::join(failure.messages, ", "));
    }
    return out;
}

} // namespace sqlgate
