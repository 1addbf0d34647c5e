#pragma once

#include <pooldispatch/core/common/errors.hpp>
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace PoolDispatch {

// One subscriber callback that threw during delivery
struct CallbackFailureRecord {
    std::string event_type;
    uint64_t subscription_id{0};
    std::string label;
    std::string message;
    bool deferred{false};
    Errc code{Errc::CallbackFailure};
};

/**
 * @class CallbackFailureLog
 * @brief Record of subscriber callbacks that threw during publish.
 *
 * Failures are caught by the dispatcher and never reach the publisher; this
 * log is where they end up instead.
 *
 * Features:
 * - Tracks total failure count (atomic)
 * - Stores the most recent N records for inspection (ring buffer)
 * - Thread-safe
 */
class CallbackFailureLog {
public:
    static constexpr size_t kDefaultCapacity = 256;

    explicit CallbackFailureLog(size_t capacity = kDefaultCapacity);
    ~CallbackFailureLog() = default;

    /**
     * @brief Store one failure (oldest record evicted when full)
     */
    void record(CallbackFailureRecord failure);

    /**
     * @brief Total failures ever recorded, evicted ones included
     */
    size_t totalFailures() const {
        return total_failures_.load(std::memory_order_relaxed);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stored_.size();
    }

    size_t capacity() const { return capacity_; }

    /**
     * @brief Most recent failures, newest first
     */
    std::vector<CallbackFailureRecord> recent(size_t max_count = 100) const;

    /**
     * @brief Drop stored records (total count is kept)
     */
    void clear();

private:
    size_t capacity_;
    std::atomic<size_t> total_failures_{0};
    mutable std::mutex mutex_;
    std::deque<CallbackFailureRecord> stored_;
};

} // namespace PoolDispatch
