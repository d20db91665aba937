#pragma once

#include <cstddef>
#include <list>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace muxcache {

/**
 * LRU cache statistics
 */
struct CacheStats {
    size_t hits;
    size_t misses;
    size_t evictions;
    size_t entries_count;
};

/**
 * Fixed-capacity key/value container with least-recently-used eviction
 *
 * Features:
 * - O(1) set/touch/remove via hash map + recency list
 * - Most recently used entry at the front of the list
 * - No time-based expiry: entries leave only under capacity pressure
 *   or by explicit removal
 *
 * Not synchronized; owners that share an instance between threads must
 * guard it (CachingLoader does).
 */
template <typename K, typename V, typename Hash = std::hash<K>>
class LRUCache {
public:
    using Entry = std::pair<K, V>;
    using const_iterator = typename std::list<Entry>::const_iterator;

    /**
     * Constructor
     * @param capacity Maximum number of entries (must be > 0)
     */
    explicit LRUCache(size_t capacity)
        : capacity_(capacity)
        , hits_(0)
        , misses_(0)
        , evictions_(0)
    {
        if (capacity_ == 0) {
            throw std::invalid_argument("LRUCache: capacity must be greater than zero");
        }
    }

    /**
     * Insert or update an entry and mark it most recently used.
     * Evicts the least recently used entry when inserting into a full cache.
     */
    void set(const K& key, V value) {
        auto it = map_.find(key);
        if (it != map_.end()) {
            it->second->second = std::move(value);
            list_.splice(list_.begin(), list_, it->second);
            return;
        }

        if (list_.size() == capacity_) {
            evict_lru();
        }

        list_.emplace_front(key, std::move(value));
        map_[key] = list_.begin();
    }

    /**
     * Look up an entry and mark it most recently used
     * @return the value, or std::nullopt on a miss
     */
    std::optional<V> touch(const K& key) {
        auto it = map_.find(key);
        if (it == map_.end()) {
            misses_++;
            return std::nullopt;
        }
        list_.splice(list_.begin(), list_, it->second);
        hits_++;
        return it->second->second;
    }

    /**
     * Check presence without affecting recency
     */
    bool has(const K& key) const {
        return map_.find(key) != map_.end();
    }

    void remove(const K& key) {
        auto it = map_.find(key);
        if (it != map_.end()) {
            list_.erase(it->second);
            map_.erase(it);
        }
    }

    void remove_all() {
        list_.clear();
        map_.clear();
    }

    size_t size() const { return list_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return list_.empty(); }

    // Iteration order: most recently used first
    const_iterator begin() const { return list_.begin(); }
    const_iterator end() const { return list_.end(); }

    CacheStats get_stats() const {
        CacheStats stats;
        stats.hits = hits_;
        stats.misses = misses_;
        stats.evictions = evictions_;
        stats.entries_count = list_.size();
        return stats;
    }

private:
    void evict_lru() {
        auto& victim = list_.back();
        map_.erase(victim.first);
        list_.pop_back();
        evictions_++;
    }

    size_t capacity_;
    std::list<Entry> list_;
    std::unordered_map<K, typename std::list<Entry>::iterator, Hash> map_;

    size_t hits_;
    size_t misses_;
    size_t evictions_;
};

} // namespace muxcache
