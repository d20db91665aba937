#pragma once

#include "mux/fetcher.hpp"
#include "mux/mux_config.hpp"
#include "mux/repository.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace muxcache {

/**
 * Single-flight cache for one named entity (a user's own profile, an app
 * config document, ...)
 *
 * Features:
 * - At most one producer call in flight; concurrent callers share its result
 * - Memoized for config.ttl (default 30 minutes)
 * - Soft refresh via refresh(), hard invalidation via clear()/clear_memory()
 * - Falls back to the last known value on transient producer errors,
 *   including a value persisted by flush() in an earlier process
 *
 * The persistent store key is the cache ID, in the store's root domain.
 *
 * Example usage:
 *   auto settings = std::make_shared<Multiplexer<AppSettings>>("app-settings",
 *       [&api](Completion<AppSettings> done) { api.fetch_settings(done); });
 *   settings->request([](const Result<AppSettings>& r) { ... });
 */
template <typename T>
class Multiplexer : public RepositoryMember {
public:
    using Producer = typename Fetcher<T>::Producer;

    /**
     * Constructor
     * @param cache_id Stable identifier; also the persistent store key
     * @param producer Fetches the entity; must call its completion exactly once
     * @param config TTL, error policy, persistent store, clock
     * @throws std::invalid_argument if cache_id is empty or producer is null
     */
    Multiplexer(std::string cache_id, Producer producer, MuxConfig config = MuxConfig())
        : cache_id_(std::move(cache_id))
        , producer_(std::move(producer))
        , config_(std::make_shared<const MuxConfig>(std::move(config)))
    {
        if (cache_id_.empty()) {
            throw std::invalid_argument("Multiplexer: cache_id must not be empty");
        }
        if (!producer_) {
            throw std::invalid_argument("Multiplexer: producer cannot be null");
        }
        fetcher_ = std::make_shared<Fetcher<T>>(
            CacheContext(cache_id_, ""), cache_id_, "", config_);
    }

    void request(Completion<T> completion) {
        request(false, std::move(completion));
    }

    /**
     * @param refresh Fetch even if the memoized value is fresh
     * @param completion Receives the result exactly once
     */
    void request(bool refresh, Completion<T> completion) {
        fetcher_->request(refresh, std::move(completion), producer_);
    }

    /**
     * Soft refresh: the next request() fetches; returns *this for chaining
     */
    Multiplexer& refresh() {
        fetcher_->refresh();
        return *this;
    }

    Multiplexer& flush() override {
        fetcher_->flush();
        return *this;
    }

    Multiplexer& clear_memory() override {
        fetcher_->clear_memory();
        return *this;
    }

    Multiplexer& clear() override {
        fetcher_->clear();
        return *this;
    }

    const std::string& cache_id() const override { return cache_id_; }

    FetcherState state() const { return fetcher_->state(); }

    /**
     * The memoized value if it is fresh
     */
    std::optional<T> stored_value() const { return fetcher_->fresh_value(); }

private:
    std::string cache_id_;
    Producer producer_;
    std::shared_ptr<const MuxConfig> config_;
    std::shared_ptr<Fetcher<T>> fetcher_;
};

} // namespace muxcache
