#include "catalog/database_registry.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <mutex>

namespace sqlgate {

void DatabaseRegistry::upsert(const DatabaseInfo& info, const std::string& account_id) {
    std::unique_lock lock(mutex_);
    entries_.insert_or_assign(info.id, Entry{info, account_id, utils::now()});
}

std::optional<DatabaseRegistry::Entry> DatabaseRegistry::find(const std::string& id) const {
    std::shared_lock lock(mutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::vector<DatabaseRegistry::Entry> DatabaseRegistry::list() const {
    std::vector<Entry> out;
    {
        std::shared_lock lock(mutex_);
        out.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            out.push_back(entry);
        }
    }
    std::sort(out.begin(), out.end(), [](const Entry& a, const Entry& b) {
        return a.info.name < b.info.name;
    });
    return out;
}

size_t DatabaseRegistry::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

} // namespace sqlgate
