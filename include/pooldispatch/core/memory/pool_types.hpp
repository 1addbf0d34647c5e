#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace PoolDispatch {

/**
 * PoolHandle - borrowed reference to one pooled resource
 *
 * A handle names (pool key, slot, generation). The slot generation is bumped
 * every time the slot goes back to idle, so a handle kept after release no
 * longer matches and cannot touch whoever acquires the slot next.
 */
struct PoolHandle {
    static constexpr uint32_t kInvalidSlot = UINT32_MAX;

    std::string pool;
    uint32_t slot{kInvalidSlot};
    uint32_t generation{0};

    bool valid() const { return !pool.empty() && slot != kInvalidSlot; }

    bool operator==(const PoolHandle& other) const {
        return slot == other.slot && generation == other.generation && pool == other.pool;
    }
    bool operator!=(const PoolHandle& other) const { return !(*this == other); }
};

// Creation parameters for one named pool
struct PoolConfig {
    std::string key;
    size_t initial_size{0};
    size_t max_size{0};
    size_t expand_by{1};
    bool auto_expand{false};
};

struct PoolStats {
    size_t idle{0};
    size_t active{0};
    size_t total{0};     // idle + active
    size_t capacity{0};  // max_size
};

// Metadata of a slot as seen through a handle
struct HandleInfo {
    std::string pool;
    uint32_t slot{PoolHandle::kInvalidSlot};
    uint32_t generation{0};
    bool active{false};
    bool auto_release_pending{false};
};

} // namespace PoolDispatch
