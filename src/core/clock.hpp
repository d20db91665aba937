#pragma once

#include <chrono>
#include <functional>

namespace muxcache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * Injectable time source; caches read the current time only through this
 */
using TimeSource = std::function<TimePoint()>;

inline TimeSource system_time_source() {
    return [] { return Clock::now(); };
}

} // namespace muxcache
