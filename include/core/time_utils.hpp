#pragma once

#include <chrono>
#include <cstdint>

namespace framegov {

// Monotonic timestamps in nanoseconds; the event loop's default clock.
inline int64_t nowSteadyNs() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

inline int64_t msToNs(int64_t ms) { return ms * 1000000LL; }

inline double nsToMs(int64_t ns) { return static_cast<double>(ns) / 1e6; }

}  // namespace framegov
