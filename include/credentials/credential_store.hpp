#pragma once

#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sqlgate {

/**
 * @brief Source of the credential used for remote calls
 *
 * The gateway depends on this interface only, so a per-tenant store can
 * replace the single-slot one without touching it.
 */
class ICredentialStore {
public:
    virtual ~ICredentialStore() = default;

    [[nodiscard]] virtual std::optional<CredentialSet> get_active() const = 0;
};

struct CredentialRecord {
    std::string id;
    std::string name;
    std::string account_id;
    std::string api_token;
    bool active = false;
    std::chrono::system_clock::time_point created_at;
};

/**
 * @brief In-memory credential store with exactly one active slot
 *
 * add() makes the new record the active one and deactivates the rest.
 * Removing the active record leaves the store without an active credential.
 */
class CredentialStore : public ICredentialStore {
public:
    CredentialStore() = default;

    [[nodiscard]] std::optional<CredentialSet> get_active() const override;

    CredentialRecord add(std::string name, std::string account_id, std::string api_token);

    /// @return false if no record has this id
    bool set_active(const std::string& id);

    /// @return false if no record has this id
    bool remove(const std::string& id);

    [[nodiscard]] std::vector<CredentialRecord> list() const;
    [[nodiscard]] std::optional<CredentialRecord> find(const std::string& id) const;

private:
    std::vector<CredentialRecord> records_;
    mutable std::shared_mutex mutex_;
};

} // namespace sqlgate
