#pragma once
#include <cstddef>
#include <string>

namespace PoolDispatch {

/**
 * Anything the tick loop sweeps for finished-but-unreleased resources.
 */
class Reclaimable {
public:
    virtual ~Reclaimable() = default;

    // Return finished resources to their pools. Never throws.
    virtual size_t reclaimFinished() = 0;

    virtual const std::string& name() const = 0;
};

} // namespace PoolDispatch
