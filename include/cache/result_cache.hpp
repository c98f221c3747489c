#pragma once

#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlgate {

/**
 * @brief Cached successful execution, addressed by (fingerprint, database_id)
 */
struct CacheEntry {
    std::string fingerprint;
    std::string database_id;
    std::vector<Row> rows;
    int64_t row_count = 0;
    int64_t elapsed_ms = 0;
    std::chrono::steady_clock::time_point created_at;
};

/**
 * @brief Query result cache with time-based staleness
 *
 * - An entry older than ttl is treated as absent (lazily dropped on get)
 * - put() on an existing key overwrites it (last write wins)
 * - Sharded by key, one mutex per shard; LRU-bounded per shard
 * - Only successful executions are ever stored
 */
class ResultCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    struct Config {
        bool enabled = true;
        size_t max_entries = 5000;
        size_t num_shards = 16;
        std::chrono::seconds ttl{300};
        Clock clock;                      // empty → steady_clock::now
    };

    ResultCache();
    explicit ResultCache(Config config);

    /// Lookup cached result. Returns nullopt on miss or when stale.
    [[nodiscard]] std::optional<CacheEntry> get(
        const std::string& fingerprint, const std::string& database_id);

    void put(const std::string& fingerprint, const std::string& database_id,
             std::vector<Row> rows, int64_t row_count, int64_t elapsed_ms);

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }
    [[nodiscard]] std::chrono::seconds ttl() const { return config_.ttl; }

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t evictions;
        size_t current_entries;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    class Shard {
    public:
        explicit Shard(size_t max_entries) : max_entries_(max_entries) {}

        std::optional<CacheEntry> get(const std::string& key,
                                      std::chrono::steady_clock::time_point now,
                                      std::chrono::seconds ttl);
        void put(const std::string& key, CacheEntry entry);
        size_t size() const;

        std::atomic<uint64_t> evictions{0};

    private:
        struct Node {
            std::string key;
            CacheEntry entry;
        };

        mutable std::mutex mutex_;
        size_t max_entries_;
        std::list<Node> lru_list_;
        std::unordered_map<std::string, std::list<Node>::iterator> map_;
    };

    static std::string make_key(const std::string& fingerprint, const std::string& database_id);
    size_t select_shard(const std::string& key) const;
    std::chrono::steady_clock::time_point now() const;

    Config config_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

} // namespace sqlgate
