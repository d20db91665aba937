#pragma once

#include "core/result.hpp"
#include <any>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace muxcache {

namespace detail {
template <typename T>
struct type_identity {
    using type = T;
};
} // namespace detail

template <typename T> class Multiplexer;
template <typename K, typename T, typename Hash> class MultiplexerMap;
template <typename T> class CachingLoader;

/**
 * An asynchronous operation delivering a Result<T> through its callback
 */
template <typename T>
using OnFetch = std::function<void(Completion<T>)>;

/**
 * Joins several independent asynchronous operations into one result
 *
 * Operations are stored by add() and started together by sync(). The final
 * completion runs once, after every operation has reported (failures do not
 * short-circuit), with the results in add() order. A Zipper can be synced
 * repeatedly; each sync() starts all operations again.
 *
 * Results are type-erased (Result<std::any>); use sync_all() for a typed join.
 *
 * Example usage:
 *   Zipper()
 *       .add(settings)
 *       .add("u1", profiles)
 *       .sync([](const std::vector<Result<std::any>>& results) { ... });
 */
class Zipper {
public:
    using AnyResult = Result<std::any>;
    using OnResults = std::function<void(const std::vector<AnyResult>&)>;

    Zipper() = default;

    /**
     * Add an arbitrary operation
     */
    template <typename T>
    Zipper& add(OnFetch<T> on_fetch) {
        fetchers_.push_back([on_fetch](Completion<std::any> on_any) {
            on_fetch([on_any](const Result<T>& result) {
                on_any(result.template map<std::any>([](const T& value) { return std::any(value); }));
            });
        });
        return *this;
    }

    /**
     * Add a Multiplexer; its request() runs as part of the join
     */
    template <typename T>
    Zipper& add(std::shared_ptr<Multiplexer<T>> multiplexer) {
        return add<T>([multiplexer](Completion<T> done) {
            multiplexer->request(std::move(done));
        });
    }

    /**
     * Add one key of a MultiplexerMap
     */
    template <typename K, typename T, typename Hash>
    Zipper& add(const typename detail::type_identity<K>::type& key,
                std::shared_ptr<MultiplexerMap<K, T, Hash>> map) {
        return add<T>([key, map](Completion<T> done) {
            map->request(key, std::move(done));
        });
    }

    /**
     * Add a blob by URL
     */
    template <typename T>
    Zipper& add(const std::string& url, std::shared_ptr<CachingLoader<T>> loader) {
        return add<T>([url, loader](Completion<T> done) {
            loader->request(url, std::move(done));
        });
    }

    /**
     * Start all operations and deliver their results together
     * @param completion Called once with one result per add(), in add() order
     */
    void sync(OnResults completion) const {
        if (fetchers_.empty()) {
            completion({});
            return;
        }

        auto state = std::make_shared<JoinState>(fetchers_.size(), std::move(completion));
        for (size_t i = 0; i < fetchers_.size(); ++i) {
            fetchers_[i]([state, i](const AnyResult& result) {
                state->deliver(i, result);
            });
        }
    }

    size_t size() const { return fetchers_.size(); }

    /**
     * Typed join of heterogeneous operations
     *
     *   Zipper::sync_all<A, B>([](const Result<A>& a, const Result<B>& b) { ... }, fetch_a, fetch_b);
     */
    template <typename... Ts, typename OnTypedResults>
    static void sync_all(OnTypedResults on_results,
                         typename detail::type_identity<OnFetch<Ts>>::type... on_fetch) {
        Zipper zipper;
        (zipper.add<Ts>(std::move(on_fetch)), ...);
        zipper.sync([on_results](const std::vector<AnyResult>& results) {
            invoke_typed<Ts...>(on_results, results, std::index_sequence_for<Ts...>{});
        });
    }

private:
    using AnyFetcher = std::function<void(Completion<std::any>)>;

    struct JoinState {
        JoinState(size_t count, OnResults on_done)
            : slots(count), remaining(count), completion(std::move(on_done)) {}

        void deliver(size_t index, const AnyResult& result) {
            std::vector<AnyResult> ready;
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (slots[index]) {
                    return;  // leg reported twice
                }
                slots[index] = result;
                if (--remaining > 0) {
                    return;
                }
                ready.reserve(slots.size());
                for (auto& slot : slots) {
                    ready.push_back(std::move(*slot));
                }
            }
            completion(ready);
        }

        std::mutex mutex;
        std::vector<std::optional<AnyResult>> slots;
        size_t remaining;
        OnResults completion;
    };

    template <typename T>
    static Result<T> unwrap(const AnyResult& result) {
        return result.template map<T>([](const std::any& value) { return std::any_cast<T>(value); });
    }

    template <typename... Ts, typename OnTypedResults, size_t... I>
    static void invoke_typed(OnTypedResults& on_results,
                             const std::vector<AnyResult>& results,
                             std::index_sequence<I...>) {
        on_results(unwrap<Ts>(results[I])...);
    }

    std::vector<AnyFetcher> fetchers_;
};

} // namespace muxcache
