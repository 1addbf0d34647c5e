#include <pooldispatch/core/common/priority.hpp>
#include <pooldispatch/core/common/errors.hpp>
#include <algorithm>
#include <cctype>

namespace PoolDispatch {

    const char* toString(Priority priority) {
        switch (priority) {
            case Priority::Critical:   return "CRITICAL";
            case Priority::High:       return "HIGH";
            case Priority::Normal:     return "NORMAL";
            case Priority::Low:        return "LOW";
            case Priority::Background: return "BACKGROUND";
            default:                   return "UNKNOWN";
        }
    }

    Priority parsePriority(const std::string& name) {
        std::string upper = name;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        if (upper == "CRITICAL")   return Priority::Critical;
        if (upper == "HIGH")       return Priority::High;
        if (upper == "NORMAL")     return Priority::Normal;
        if (upper == "LOW")        return Priority::Low;
        if (upper == "BACKGROUND") return Priority::Background;

        throw CoreError(Errc::InvalidArgument, "Unknown priority name: " + name);
    }

} // namespace PoolDispatch
