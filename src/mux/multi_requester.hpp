#pragma once

#include "mux/multiplexer_map.hpp"
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace muxcache {

/**
 * Combines multi-key backend requests (e.g. GET /profiles/[id1,id2]) with
 * the per-key cache of a MultiplexerMap
 *
 * Fresh values already in the map are reused; only the remaining keys are
 * sent to the multi-key producer, and everything it returns is stored back
 * into the map. Entities are therefore cached the same way whether they were
 * fetched one by one or in bulk.
 */
template <typename K, typename T, typename Hash = std::hash<K>>
class MultiRequester {
public:
    using Map = MultiplexerMap<K, T, Hash>;
    using KeyOf = std::function<K(const T&)>;
    using MultiProducer = std::function<void(const std::vector<K>&, Completion<std::vector<T>>)>;

    /**
     * Receives whatever values are available and, if the producer failed,
     * its error. The value set may be partial in both cases.
     */
    using OnMultiResult = std::function<void(const std::map<K, T>&, std::exception_ptr)>;

    /**
     * Constructor
     * @param map Per-key cache that this requester reads and updates
     * @param key_of Extracts the key from an entity
     * @param producer Fetches several entities in one call
     * @throws std::invalid_argument if any argument is null
     */
    MultiRequester(std::shared_ptr<Map> map, KeyOf key_of, MultiProducer producer)
        : map_(std::move(map))
        , key_of_(std::move(key_of))
        , producer_(std::move(producer))
    {
        if (!map_ || !key_of_ || !producer_) {
            throw std::invalid_argument("MultiRequester: map, key_of and producer are required");
        }
    }

    /**
     * Retrieve entities for a set of keys.
     *
     * If all keys are fresh in the map, the completion runs before this call
     * returns. On producer failure, the transient-error fallback policy is
     * applied per remaining key and any fallback values are included.
     * Neither the number nor the order of results is guaranteed to match keys.
     */
    void request(const std::vector<K>& keys, OnMultiResult completion) {
        auto values = std::make_shared<std::map<K, T>>();
        std::vector<K> remaining;
        for (const auto& key : keys) {
            auto cached = map_->stored_value(key);
            if (cached) {
                values->insert_or_assign(key, std::move(*cached));
            } else {
                remaining.push_back(key);
            }
        }

        if (remaining.empty()) {
            if (completion) {
                completion(*values, nullptr);
            }
            return;
        }

        auto map = map_;
        KeyOf key_of = key_of_;
        producer_(remaining, [map, key_of, values, remaining, completion](const Result<std::vector<T>>& result) {
            if (result.ok()) {
                for (const auto& value : result.value()) {
                    K key = key_of(value);
                    map->store_success(key, value);
                    values->insert_or_assign(key, value);
                }
                if (completion) {
                    completion(*values, nullptr);
                }
                return;
            }

            for (const auto& key : remaining) {
                auto fallback = map->store_failure(key, result.error());
                if (fallback) {
                    values->insert_or_assign(key, std::move(*fallback));
                }
            }
            if (completion) {
                completion(*values, result.error());
            }
        });
    }

    /**
     * Store entities obtained by other means into the map
     */
    void store_success(const std::vector<T>& values) {
        for (const auto& value : values) {
            map_->store_success(key_of_(value), value);
        }
    }

private:
    std::shared_ptr<Map> map_;
    KeyOf key_of_;
    MultiProducer producer_;
};

} // namespace muxcache
