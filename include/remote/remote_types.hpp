#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sqlgate {

/**
 * @brief Failure classes at the remote client boundary
 *
 * TRANSPORT:      non-2xx status, connection error, timeout, malformed envelope
 * AUTHENTICATION: HTTP 401/403 (tagged apart so no message text is needed)
 * APPLICATION:    HTTP 2xx with success:false in the envelope
 */
enum class RemoteFailureKind : uint8_t {
    TRANSPORT,
    AUTHENTICATION,
    APPLICATION
};

struct RemoteFailure {
    RemoteFailureKind kind = RemoteFailureKind::TRANSPORT;
    int status_code = 0;                 // 0 when no HTTP response was received
    std::string status_text;
    std::vector<std::string> messages;   // APPLICATION: every attached error message

    static RemoteFailure transport(int status, std::string text) {
        const auto kind = (status == 401 || status == 403)
            ? RemoteFailureKind::AUTHENTICATION
            : RemoteFailureKind::TRANSPORT;
        return {kind, status, std::move(text), {}};
    }

    static RemoteFailure application(std::vector<std::string> msgs) {
        return {RemoteFailureKind::APPLICATION, 200, "", std::move(msgs)};
    }
};

/**
 * @brief Value-or-RemoteFailure returned by IRemoteSqlClient
 */
template<typename T>
class RemoteResult {
public:
    static RemoteResult ok(T value) {
        RemoteResult r;
        r.value_ = std::move(value);
        return r;
    }

    static RemoteResult failure(RemoteFailure f) {
        RemoteResult r;
        r.failure_ = std::move(f);
        return r;
    }

    [[nodiscard]] bool is_ok() const { return value_.has_value(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const RemoteFailure& failure() const { return *failure_; }

private:
    std::optional<T> value_;
    std::optional<RemoteFailure> failure_;
};

} // namespace sqlgate
