#include <pooldispatch/core/events/callback_failure_log.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace PoolDispatch {

CallbackFailureLog::CallbackFailureLog(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
    spdlog::debug("[CallbackFailureLog] Initialized (max stored: {})", capacity_);
}

void CallbackFailureLog::record(CallbackFailureRecord failure) {
    total_failures_.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(mutex_);
    if (stored_.size() >= capacity_) {
        stored_.pop_front();
    }
    stored_.push_back(std::move(failure));
}

std::vector<CallbackFailureRecord> CallbackFailureLog::recent(size_t max_count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<CallbackFailureRecord> result;
    size_t count = std::min(max_count, stored_.size());
    result.reserve(count);

    auto it = stored_.rbegin();
    for (size_t i = 0; i < count && it != stored_.rend(); ++i, ++it) {
        result.push_back(*it);
    }
    return result;
}

void CallbackFailureLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    stored_.clear();
    spdlog::info("[CallbackFailureLog] Records cleared (total failures remains: {})",
                 total_failures_.load(std::memory_order_relaxed));
}

} // namespace PoolDispatch
