#pragma once

#include "core/mux_key.hpp"
#include "mux/fetcher.hpp"
#include "mux/mux_config.hpp"
#include "mux/repository.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace muxcache {

/**
 * Single-flight cache for a collection of entities of the same type, e.g.
 * user profiles keyed by user ID
 *
 * Each key gets its own fetch coordinator, created on first use. Requests for
 * different keys run independently; requests for the same key share one
 * producer call.
 *
 * Persistence: the store domain is the cache ID and each entity is stored
 * under to_key_string(key) within it. Values are written by flush() only.
 *
 * Example usage:
 *   auto profiles = std::make_shared<MultiplexerMap<std::string, Profile>>("profiles",
 *       [&api](const std::string& id, Completion<Profile> done) { api.fetch_profile(id, done); });
 *   profiles->request("u1", [](const Result<Profile>& r) { ... });
 */
template <typename K, typename T, typename Hash = std::hash<K>>
class MultiplexerMap : public RepositoryMember {
public:
    using KeyProducer = std::function<void(const K&, Completion<T>)>;

    /**
     * Constructor
     * @param cache_id Stable identifier; also the persistent store domain
     * @param producer Fetches one entity by key
     * @param config TTL, error policy, persistent store, clock
     * @throws std::invalid_argument if cache_id is empty or producer is null
     */
    MultiplexerMap(std::string cache_id, KeyProducer producer, MuxConfig config = MuxConfig())
        : cache_id_(std::move(cache_id))
        , producer_(std::move(producer))
        , config_(std::make_shared<const MuxConfig>(std::move(config)))
    {
        if (cache_id_.empty()) {
            throw std::invalid_argument("MultiplexerMap: cache_id must not be empty");
        }
        if (!producer_) {
            throw std::invalid_argument("MultiplexerMap: producer cannot be null");
        }
    }

    void request(const K& key, Completion<T> completion) {
        request(false, key, std::move(completion));
    }

    /**
     * Serve the entity from memory or fetch it, sharing an in-flight fetch
     * @param refresh Fetch even if the memoized value is fresh
     * @param key Entity key
     * @param completion Receives the result exactly once
     * @throws std::invalid_argument if the key's string form is empty
     */
    void request(bool refresh, const K& key, Completion<T> completion) {
        auto fetcher = fetcher_for(key);
        KeyProducer producer = producer_;
        fetcher->request(refresh, std::move(completion), [producer, key](Completion<T> done) {
            producer(key, std::move(done));
        });
    }

    /**
     * Soft refresh for one key; no effect if the key was never requested
     */
    MultiplexerMap& refresh(const K& key) {
        if (auto fetcher = find_fetcher(key)) {
            fetcher->refresh();
        }
        return *this;
    }

    /**
     * Forget one entity in memory; an in-flight fetch for it still answers
     * its waiters but no longer populates the map
     */
    void clear_memory(const K& key) {
        std::shared_ptr<Fetcher<T>> removed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = fetchers_.find(key);
            if (it == fetchers_.end()) {
                return;
            }
            removed = std::move(it->second);
            fetchers_.erase(it);
        }
        removed->clear_memory();
    }

    /**
     * Forget one entity in memory and in the persistent store
     */
    void clear(const K& key) {
        std::string key_string = checked_key_string(key);
        clear_memory(key);
        config_->cacher->delete_one(key_string, cache_id_);
    }

    MultiplexerMap& clear_memory() override {
        std::unordered_map<K, std::shared_ptr<Fetcher<T>>, Hash> removed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            removed.swap(fetchers_);
        }
        for (auto& [key, fetcher] : removed) {
            fetcher->clear_memory();
        }
        return *this;
    }

    MultiplexerMap& clear() override {
        clear_memory();
        config_->cacher->delete_domain(cache_id_);
        return *this;
    }

    MultiplexerMap& flush() override {
        for (auto& fetcher : snapshot()) {
            fetcher->flush();
        }
        return *this;
    }

    const std::string& cache_id() const override { return cache_id_; }

    /**
     * The memoized value for a key if it is fresh
     */
    std::optional<T> stored_value(const K& key) const {
        if (auto fetcher = find_fetcher(key)) {
            return fetcher->fresh_value();
        }
        return std::nullopt;
    }

    /**
     * Store a value fetched by other means (e.g. a multi-key request)
     */
    void store_success(const K& key, T value) {
        fetcher_for(key)->store_success(std::move(value));
    }

    /**
     * Apply the transient-error fallback policy for a key whose fetch failed
     * by other means
     * @return the fallback value, if the policy yields one
     */
    std::optional<T> store_failure(const K& key, const std::exception_ptr& error) {
        return fetcher_for(key)->store_failure(error);
    }

    FetcherState state(const K& key) const {
        if (auto fetcher = find_fetcher(key)) {
            return fetcher->state();
        }
        return FetcherState::EMPTY;
    }

    /**
     * Number of keys with a coordinator in memory
     */
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fetchers_.size();
    }

private:
    std::string checked_key_string(const K& key) const {
        std::string key_string = to_key_string(key);
        if (key_string.empty()) {
            throw std::invalid_argument("MultiplexerMap '" + cache_id_ + "': key must not be empty");
        }
        return key_string;
    }

    std::shared_ptr<Fetcher<T>> fetcher_for(const K& key) {
        std::string key_string = checked_key_string(key);

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = fetchers_.find(key);
        if (it != fetchers_.end()) {
            return it->second;
        }
        auto fetcher = std::make_shared<Fetcher<T>>(
            CacheContext(cache_id_, key_string), key_string, cache_id_, config_);
        fetchers_.emplace(key, fetcher);
        return fetcher;
    }

    std::shared_ptr<Fetcher<T>> find_fetcher(const K& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = fetchers_.find(key);
        return it != fetchers_.end() ? it->second : nullptr;
    }

    std::vector<std::shared_ptr<Fetcher<T>>> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::shared_ptr<Fetcher<T>>> result;
        result.reserve(fetchers_.size());
        for (const auto& [key, fetcher] : fetchers_) {
            result.push_back(fetcher);
        }
        return result;
    }

    std::string cache_id_;
    KeyProducer producer_;
    std::shared_ptr<const MuxConfig> config_;

    mutable std::mutex mutex_;
    std::unordered_map<K, std::shared_ptr<Fetcher<T>>, Hash> fetchers_;
};

} // namespace muxcache
