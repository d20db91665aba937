/**
 * @file fetcher.hpp
 * @brief Per-entity single-flight fetch coordinator
 *
 * A Fetcher owns the memoized value of one entity and guarantees that at most
 * one producer call is in flight for it. Callers arriving while a fetch is
 * running are queued and all receive the result of that single call, in
 * arrival order.
 *
 * Thread safety: state transitions are guarded by a mutex. The producer,
 * persistent store reads on the failure path, and user callbacks always run
 * outside the lock, so a callback may issue a new request on the same entity.
 */

#pragma once

#include "core/result.hpp"
#include "mux/mux_config.hpp"
#include "storage/json_codec.hpp"
#include "util/logger.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace muxcache {

/**
 * @brief Fetch coordinator state
 */
enum class FetcherState {
    EMPTY,      ///< No value, never fetched (or cleared)
    FRESH,      ///< Value present and within TTL
    STALE,      ///< Value present but expired, refresh requested, or kept as a fallback
    FETCHING    ///< Producer call outstanding
};

inline std::string state_to_string(FetcherState state) {
    switch (state) {
        case FetcherState::EMPTY: return "EMPTY";
        case FetcherState::FRESH: return "FRESH";
        case FetcherState::STALE: return "STALE";
        case FetcherState::FETCHING: return "FETCHING";
        default: return "UNKNOWN";
    }
}

template <typename T>
class Fetcher : public std::enable_shared_from_this<Fetcher<T>> {
public:
    using Producer = std::function<void(Completion<T>)>;

    /**
     * Constructor
     * @param context Cache ID and entity key, for logging
     * @param store_key Persistent store key
     * @param domain Persistent store domain
     * @param config Shared strategy configuration
     */
    Fetcher(CacheContext context,
            std::string store_key,
            std::string domain,
            std::shared_ptr<const MuxConfig> config)
        : context_(std::move(context))
        , store_key_(std::move(store_key))
        , domain_(std::move(domain))
        , config_(std::move(config))
        , refresh_requested_(false)
        , dirty_(false)
        , generation_(0)
    {
    }

    Fetcher(const Fetcher&) = delete;
    Fetcher& operator=(const Fetcher&) = delete;

    /**
     * Serve the memoized value or join/start a fetch.
     *
     * A fresh value (within TTL, no pending soft refresh) is delivered to
     * `completion` before this call returns. Otherwise the completion is
     * queued and, if no fetch is in flight, `producer` is invoked.
     *
     * @param force_refresh Bypass the memoized value
     * @param completion Receives the result exactly once
     * @param producer Performs the actual fetch; must call its argument exactly once
     */
    void request(bool force_refresh, Completion<T> completion, const Producer& producer) {
        std::optional<T> hit;
        bool start_fetch = false;
        uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!force_refresh && !refresh_requested_ && is_fresh_locked()) {
                hit = stored_value_;
            } else {
                refresh_requested_ = false;
                pending_.push_back(std::move(completion));
                start_fetch = pending_.size() == 1;
                generation = generation_;
            }
        }

        if (hit) {
            Logger::get_instance().debug("Memory cache hit", {{"cache_id", context_.cache_id}, {"key", context_.key}});
            completion(Result<T>::success(std::move(*hit)));
            return;
        }

        if (!start_fetch) {
            return;
        }

        Logger::get_instance().log_fetch_started(context_);

        auto self = this->shared_from_this();
        auto delivered = std::make_shared<std::atomic<bool>>(false);
        try {
            producer([self, generation, delivered](const Result<T>& result) {
                if (delivered->exchange(true)) {
                    Logger::get_instance().warn("Producer completed more than once; result ignored",
                        {{"cache_id", self->context_.cache_id}, {"key", self->context_.key}});
                    return;
                }
                self->resolve(generation, result);
            });
        } catch (...) {
            if (delivered->exchange(true)) {
                throw;
            }
            resolve(generation, Result<T>::failure(std::current_exception()));
        }
    }

    /**
     * Request a soft refresh: the next request() fetches even if the value is
     * fresh. Does not affect a fetch already in flight.
     */
    void refresh() {
        std::lock_guard<std::mutex> lock(mutex_);
        refresh_requested_ = true;
    }

    /**
     * Drop the memoized value.
     *
     * A fetch in flight is not cancelled: its waiters still receive its
     * result, but that result no longer updates this entity's state.
     */
    void clear_memory() {
        std::lock_guard<std::mutex> lock(mutex_);
        stored_value_.reset();
        completion_time_.reset();
        dirty_ = false;
        generation_++;
    }

    /**
     * Drop the memoized value and the persisted copy
     */
    void clear() {
        clear_memory();
        config_->cacher->delete_one(store_key_, domain_);
    }

    /**
     * Write the value to the persistent store if it changed since the last write.
     * Write failures are logged; the value stays dirty.
     */
    void flush() {
        std::optional<T> value;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!dirty_ || !stored_value_) {
                return;
            }
            value = stored_value_;
            dirty_ = false;
        }

        try {
            std::string bytes = encode_value(*value);
            config_->cacher->save(bytes, store_key_, domain_);
            Logger::get_instance().log_flushed(context_, bytes.size());
        } catch (const std::exception& e) {
            Logger::get_instance().log_storage_error(context_, e.what());
            std::lock_guard<std::mutex> lock(mutex_);
            dirty_ = true;
        }
    }

    /**
     * Store a value obtained outside of request(), e.g. from a multi-key fetch
     */
    void store_success(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        stored_value_ = std::move(value);
        completion_time_ = config_->clock();
        dirty_ = true;
    }

    /**
     * Apply the failure policy for an error obtained outside of request()
     * @return the fallback value if the error is transient and one exists
     */
    std::optional<T> store_failure(const std::exception_ptr& error) {
        uint64_t generation;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            generation = generation_;
        }
        return apply_failure(generation, error);
    }

    /**
     * The memoized value if it is fresh
     */
    std::optional<T> fresh_value() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!refresh_requested_ && is_fresh_locked()) {
            return stored_value_;
        }
        return std::nullopt;
    }

    FetcherState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_.empty()) {
            return FetcherState::FETCHING;
        }
        if (!stored_value_) {
            return FetcherState::EMPTY;
        }
        if (!refresh_requested_ && is_fresh_locked()) {
            return FetcherState::FRESH;
        }
        return FetcherState::STALE;
    }

    bool dirty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dirty_;
    }

    const std::string& store_key() const { return store_key_; }

private:
    // Stale iff now > completion_time + ttl
    bool is_fresh_locked() const {
        if (!stored_value_ || !completion_time_) {
            return false;
        }
        return config_->clock() <= *completion_time_ + config_->ttl;
    }

    std::optional<T> load_from_store() {
        auto bytes = config_->cacher->load(store_key_, domain_);
        if (!bytes) {
            return std::nullopt;
        }
        auto value = decode_value<T>(*bytes);
        if (!value) {
            Logger::get_instance().log_storage_error(context_, "Discarding undecodable cache entry");
        }
        return value;
    }

    /**
     * Failure policy: a transient error with a fallback value available keeps
     * that value (marked stale so the next request refetches); anything else
     * clears the entity. Only applied if `generation` is still current.
     */
    std::optional<T> apply_failure(uint64_t generation, const std::exception_ptr& error) {
        bool transient = config_->use_cached_result_on && config_->use_cached_result_on(error);

        std::optional<T> fallback;
        if (transient) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation == generation_) {
                fallback = stored_value_;
            }
        }

        bool from_store = false;
        if (transient && !fallback) {
            fallback = load_from_store();
            from_store = fallback.has_value();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation == generation_) {
                completion_time_.reset();
                if (fallback) {
                    stored_value_ = fallback;
                    if (from_store) {
                        dirty_ = false;
                    }
                } else {
                    stored_value_.reset();
                    dirty_ = false;
                }
            }
        }

        if (fallback) {
            Logger::get_instance().log_fallback_used(context_, error_message(error), from_store);
        }
        return fallback;
    }

    void resolve(uint64_t generation, const Result<T>& result) {
        Result<T> delivered = result;

        if (result.ok()) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation == generation_) {
                stored_value_ = result.value();
                completion_time_ = config_->clock();
                dirty_ = true;
            }
        } else {
            auto fallback = apply_failure(generation, result.error());
            if (fallback) {
                delivered = Result<T>::success(std::move(*fallback));
            } else {
                Logger::get_instance().log_fetch_failed(context_, result.error_message());
            }
        }

        // Snapshot the waiters before invoking any of them
        std::vector<Completion<T>> waiters;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            waiters.swap(pending_);
        }

        if (delivered.ok()) {
            Logger::get_instance().log_fetch_completed(context_, waiters.size());
        }

        for (auto& waiter : waiters) {
            if (waiter) {
                waiter(delivered);
            }
        }
    }

    CacheContext context_;
    std::string store_key_;
    std::string domain_;
    std::shared_ptr<const MuxConfig> config_;

    mutable std::mutex mutex_;
    std::optional<T> stored_value_;
    std::optional<TimePoint> completion_time_;
    std::vector<Completion<T>> pending_;
    bool refresh_requested_;
    bool dirty_;
    uint64_t generation_;
};

} // namespace muxcache
