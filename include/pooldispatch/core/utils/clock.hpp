// ============================================================================
// MONOTONIC TICK CLOCK

#pragma once

#include <chrono>
#include <cstdint>

namespace PoolDispatch {

class Clock {
public:
    // Current time in milliseconds (monotonic, steady). Default time source for tick().
    static inline uint64_t now_ms() {
        auto now = std::chrono::steady_clock::now();
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count());
    }

    // Deadline `delay` after `from_ms`, clamped at zero for negative delays
    static inline uint64_t deadline(uint64_t from_ms, std::chrono::milliseconds delay) {
        if (delay.count() <= 0) {
            return from_ms;
        }
        return from_ms + static_cast<uint64_t>(delay.count());
    }
};

} // namespace PoolDispatch
