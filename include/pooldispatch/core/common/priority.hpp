#pragma once
#include <cstdint>
#include <string>

namespace PoolDispatch {

    /**
     * Subscriber execution rank.
     * Lower numeric value runs earlier during a publish.
     */
    enum class Priority : uint8_t {
        Critical = 0,
        High = 1,
        Normal = 2,
        Low = 3,
        Background = 4
    };

    const char* toString(Priority priority);

    // Case-insensitive ("critical", "HIGH", ...). Throws CoreError(InvalidArgument).
    Priority parsePriority(const std::string& name);

} // namespace PoolDispatch
