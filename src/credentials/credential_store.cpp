#include "credentials/credential_store.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <mutex>

namespace sqlgate {

std::optional<CredentialSet> CredentialStore::get_active() const {
    std::shared_lock lock(mutex_);
    const auto it = std::find_if(records_.begin(), records_.end(),
        [](const CredentialRecord& r) { return r.active; });
    if (it == records_.end()) return std::nullopt;
    return CredentialSet{it->account_id, it->api_token};
}

CredentialRecord CredentialStore::add(std::string name, std::string account_id,
                                      std::string api_token) {
    CredentialRecord record{
        .id = utils::generate_uuid(),
        .name = std::move(name),
        .account_id = std::move(account_id),
        .api_token = std::move(api_token),
        .active = true,
        .created_at = utils::now(),
    };

    std::unique_lock lock(mutex_);
    for (auto& r : records_) {
        r.active = false;
    }
    records_.push_back(record);
    return record;
}

bool CredentialStore::set_active(const std::string& id) {
    std::unique_lock lock(mutex_);
    const auto it = std::find_if(records_.begin(), records_.end(),
        [&id](const CredentialRecord& r) { return r.id == id; });
    if (it == records_.end()) return false;
    for (auto& r : records_) {
        r.active = (&r == &*it);
    }
    return true;
}

bool CredentialStore::remove(const std::string& id) {
    std::unique_lock lock(mutex_);
    const auto erased = std::erase_if(records_,
        [&id](const CredentialRecord& r) { return r.id == id; });
    return erased > 0;
}

std::vector<CredentialRecord> CredentialStore::list() const {
    std::shared_lock lock(mutex_);
    return records_;
}

std::optional<CredentialRecord> CredentialStore::find(const std::string& id) const {
    std::shared_lock lock(mutex_);
    const auto it = std::find_if(records_.begin(), records_.end(),
        [&id](const CredentialRecord& r) { return r.id == id; });
    if (it == records_.end()) return std::nullopt;
    return *it;
}

} // namespace sqlgate
