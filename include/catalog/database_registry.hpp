#pragma once

#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlgate {

/**
 * @brief Mirror of databases discovered through list_databases()
 *
 * Only written by discovery; never consulted to resolve an id the caller
 * already supplied.
 */
class DatabaseRegistry {
public:
    struct Entry {
        DatabaseInfo info;
        std::string account_id;
        std::chrono::system_clock::time_point discovered_at;
    };

    void upsert(const DatabaseInfo& info, const std::string& account_id);

    [[nodiscard]] std::optional<Entry> find(const std::string& id) const;

    /// Entries sorted by database name
    [[nodiscard]] std::vector<Entry> list() const;

    [[nodiscard]] size_t size() const;

private:
    std::unordered_map<std::string, Entry> entries_;
    mutable std::shared_mutex mutex_;
};

} // namespace sqlgate
