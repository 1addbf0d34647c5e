#include <pooldispatch/core/utils/task_scheduler.hpp>
#include <pooldispatch/core/common/errors.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace PoolDispatch {

TaskScheduler::TaskScheduler(uint64_t start_ms)
    : current_ms_(start_ms) {
    spdlog::debug("[TaskScheduler] Initialized at t={}ms", start_ms);
}

void TaskScheduler::post(Task task) {
    if (!task) {
        throw CoreError(Errc::NullCallback, "cannot post an empty task");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    posted_.push_back(std::move(task));
}

TaskScheduler::TaskId TaskScheduler::scheduleAfter(std::chrono::milliseconds delay, Task task) {
    uint64_t deadline_ms = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deadline_ms = Clock::deadline(current_ms_, delay);
    }
    return scheduleAt(deadline_ms, std::move(task));
}

TaskScheduler::TaskId TaskScheduler::scheduleAt(uint64_t deadline_ms, Task task) {
    if (!task) {
        throw CoreError(Errc::NullCallback, "cannot schedule an empty task");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    TaskId id = next_id_++;
    timers_.emplace(TimerKey{deadline_ms, id}, std::move(task));
    timer_deadlines_.emplace(id, deadline_ms);
    spdlog::debug("[TaskScheduler] Timer {} scheduled for t={}ms", id, deadline_ms);
    return id;
}

bool TaskScheduler::cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timer_deadlines_.find(id);
    if (it == timer_deadlines_.end()) {
        return false;
    }
    timers_.erase(TimerKey{it->second, id});
    timer_deadlines_.erase(it);
    spdlog::debug("[TaskScheduler] Timer {} cancelled", id);
    return true;
}

size_t TaskScheduler::runDue(uint64_t now_ms) {
    std::deque<Task> batch;
    TaskId watermark = kInvalidTask;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ms_ = std::max(current_ms_, now_ms);
        batch.swap(posted_);
        watermark = next_id_;
    }

    size_t executed = 0;
    for (const auto& task : batch) {
        runGuarded(task, "posted");
        ++executed;
    }

    // Timers are taken one at a time so a cancel() issued by an earlier task
    // still prevents a later one in the same pass from running.
    Task timed;
    while (popDueTimer(now_ms, watermark, timed)) {
        runGuarded(timed, "timed");
        ++executed;
    }

    return executed;
}

bool TaskScheduler::popDueTimer(uint64_t now_ms, TaskId watermark, Task& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->first.first > now_ms) {
            return false;
        }
        if (it->first.second >= watermark) {
            continue;  // scheduled during this pass
        }
        out = std::move(it->second);
        timer_deadlines_.erase(it->first.second);
        timers_.erase(it);
        return true;
    }
    return false;
}

void TaskScheduler::runGuarded(const Task& task, const char* kind) {
    try {
        task();
    } catch (const std::exception& e) {
        spdlog::error("[TaskScheduler] {} task threw: {}", kind, e.what());
    } catch (...) {
        spdlog::error("[TaskScheduler] {} task threw a non-standard exception", kind);
    }
}

size_t TaskScheduler::pendingPosted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return posted_.size();
}

size_t TaskScheduler::pendingTimers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

uint64_t TaskScheduler::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_ms_;
}

void TaskScheduler::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = posted_.size() + timers_.size();
    posted_.clear();
    timers_.clear();
    timer_deadlines_.clear();
    spdlog::info("[TaskScheduler] Cleared {} pending tasks", dropped);
}

} // namespace PoolDispatch
