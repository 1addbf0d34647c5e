#pragma once
#include <pooldispatch/core/utils/clock.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace PoolDispatch {

/**
 * @class TaskScheduler
 * @brief Cooperative single-threaded executor driven by the host tick.
 *
 * Two kinds of work:
 * - posted tasks: run on the next runDue() in FIFO order (deferred dispatch)
 * - timed tasks: run on the first runDue() whose time reaches the deadline
 *   (timed auto-release), ordered by deadline then by scheduling order
 *
 * No threads are spawned. Tasks run with no internal lock held, so a task may
 * post, schedule or cancel other tasks. Work added while runDue() is running
 * waits for the next call.
 */
class TaskScheduler {
public:
    using Task = std::function<void()>;
    using TaskId = uint64_t;

    static constexpr TaskId kInvalidTask = 0;

    explicit TaskScheduler(uint64_t start_ms = Clock::now_ms());
    ~TaskScheduler() = default;

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    /**
     * @brief Queue a task for the next runDue()
     * @throws CoreError(NullCallback) if task is empty
     */
    void post(Task task);

    /**
     * @brief Schedule a task relative to the scheduler's current time
     * @return Id usable with cancel()
     * @throws CoreError(NullCallback) if task is empty
     */
    TaskId scheduleAfter(std::chrono::milliseconds delay, Task task);

    TaskId scheduleAt(uint64_t deadline_ms, Task task);

    /**
     * @brief Cancel a pending timed task
     * @return false if the task already ran, was cancelled, or never existed
     */
    bool cancel(TaskId id);

    /**
     * @brief Advance time to now_ms and run everything that is due
     * @return Number of tasks executed
     */
    size_t runDue(uint64_t now_ms);

    size_t pendingPosted() const;
    size_t pendingTimers() const;

    // Latest time seen by runDue() (or the start time)
    uint64_t now() const;

    // Drop all pending work without running it
    void clear();

private:
    using TimerKey = std::pair<uint64_t, TaskId>;  // (deadline, id)

    bool popDueTimer(uint64_t now_ms, TaskId watermark, Task& out);
    static void runGuarded(const Task& task, const char* kind);

    mutable std::mutex mutex_;
    std::deque<Task> posted_;
    std::map<TimerKey, Task> timers_;
    std::unordered_map<TaskId, uint64_t> timer_deadlines_;
    TaskId next_id_{1};
    uint64_t current_ms_;
};

} // namespace PoolDispatch
