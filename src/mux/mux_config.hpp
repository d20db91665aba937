#pragma once

#include "core/clock.hpp"
#include "core/errors.hpp"
#include "storage/cacher.hpp"
#include "storage/json_disk_cacher.hpp"
#include <chrono>
#include <exception>
#include <functional>
#include <memory>

namespace muxcache {

/**
 * Default memory TTL for multiplexers: 30 minutes
 */
constexpr std::chrono::seconds kDefaultTTL{30 * 60};

/**
 * Decides whether a producer error may be answered with a cached value
 */
using ErrorPredicate = std::function<bool(const std::exception_ptr&)>;

/**
 * Strategy configuration shared by Multiplexer and MultiplexerMap
 *
 * - ttl: how long a fetched value is served from memory without refetching
 * - use_cached_result_on: transient-error predicate; when it accepts an error
 *   and a previous value exists (in memory or in the persistent store), callers
 *   get that value instead of the error. TTL is ignored for this fallback.
 * - cacher: persistent store (default: JsonDiskCacher under default_cache_dir())
 * - clock: time source used for TTL decisions
 */
struct MuxConfig {
    Clock::duration ttl;
    ErrorPredicate use_cached_result_on;
    std::shared_ptr<Cacher> cacher;
    TimeSource clock;

    MuxConfig()
        : ttl(kDefaultTTL),
          use_cached_result_on(is_connectivity_error),
          cacher(std::make_shared<JsonDiskCacher>()),
          clock(system_time_source()) {}
};

} // namespace muxcache
