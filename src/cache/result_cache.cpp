#include "cache/result_cache.hpp"

#include <algorithm>
#include <format>
#include <functional>

namespace sqlgate {

// ============================================================================
// ResultCache
// ============================================================================

ResultCache::ResultCache()
    : ResultCache(Config{}) {}

ResultCache::ResultCache(Config config)
    : config_(std::move(config)) {
    const size_t num_shards = std::max(config_.num_shards, size_t{1});
    const size_t per_shard = std::max(config_.max_entries / num_shards, size_t{1});
    shards_.reserve(num_shards);
    for (size_t i = 0; i < num_shards; ++i) {
        shards_.push_back(std::make_unique<Shard>(per_shard));
    }
}

std::string ResultCache::make_key(const std::string& fingerprint,
                                  const std::string& database_id) {
    // Fingerprint is fixed-width hex, so the separator cannot be ambiguous
    return std::format("{}:{}", fingerprint, database_id);
}

size_t ResultCache::select_shard(const std::string& key) const {
    return std::hash<std::string>{}(key) % shards_.size();
}

std::chrono::steady_clock::time_point ResultCache::now() const {
    return config_.clock ? config_.clock() : std::chrono::steady_clock::now();
}

std::optional<CacheEntry> ResultCache::get(const std::string& fingerprint,
                                           const std::string& database_id) {
    if (!config_.enabled) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    const auto key = make_key(fingerprint, database_id);
    auto& shard = *shards_[select_shard(key)];
    auto result = shard.get(key, now(), config_.ttl);
    if (result) {
        hits_.fetch_add(1, std::memory_order_relaxed);
    } else {
        misses_.fetch_add(1, std::memory_order_relaxed);
    }
    return result;
}

void ResultCache::put(const std::string& fingerprint, const std::string& database_id,
                      std::vector<Row> rows, int64_t row_count, int64_t elapsed_ms) {
    if (!config_.enabled) return;

    const auto key = make_key(fingerprint, database_id);
    CacheEntry entry{
        .fingerprint = fingerprint,
        .database_id = database_id,
        .rows = std::move(rows),
        .row_count = row_count,
        .elapsed_ms = elapsed_ms,
        .created_at = now(),
    };
    auto& shard = *shards_[select_shard(key)];
    shard.put(key, std::move(entry));
}

ResultCache::Stats ResultCache::get_stats() const {
    size_t entries = 0;
    uint64_t evictions = 0;
    for (const auto& shard : shards_) {
        entries += shard->size();
        evictions += shard->evictions.load(std::memory_order_relaxed);
    }
    return {
        .hits = hits_.load(std::memory_order_relaxed),
        .misses = misses_.load(std::memory_order_relaxed),
        .evictions = evictions,
        .current_entries = entries,
    };
}

// ============================================================================
// Shard
// ============================================================================

std::optional<CacheEntry> ResultCache::Shard::get(
    const std::string& key,
    std::chrono::steady_clock::time_point now,
    std::chrono::seconds ttl) {
    std::lock_guard lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) return std::nullopt;

    // Staleness: age >= ttl counts as absent
    if (now - it->second->entry.created_at >= ttl) {
        lru_list_.erase(it->second);
        map_.erase(it);
        return std::nullopt;
    }

    // Move to front (most recently used)
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    return it->second->entry;
}

void ResultCache::Shard::put(const std::string& key, CacheEntry entry) {
    std::lock_guard lock(mutex_);

    // Supersede an existing entry for the same key
    auto it = map_.find(key);
    if (it != map_.end()) {
        it->second->entry = std::move(entry);
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }

    // Evict LRU if at capacity
    while (map_.size() >= max_entries_ && !lru_list_.empty()) {
        map_.erase(lru_list_.back().key);
        lru_list_.pop_back();
        evictions.fetch_add(1, std::memory_order_relaxed);
    }

    lru_list_.push_front(Node{key, std::move(entry)});
    map_[key] = lru_list_.begin();
}

size_t ResultCache::Shard::size() const {
    std::lock_guard lock(mutex_);
    return map_.size();
}

} // namespace sqlgate
