#include <pooldispatch/core/sequence/chained_event_runner.hpp>
#include <pooldispatch/core/common/errors.hpp>
#include <spdlog/spdlog.h>

namespace PoolDispatch {

void ChainedEventRunner::enqueue(std::shared_ptr<ChainedEvent> unit) {
    if (!unit) {
        throw CoreError(Errc::InvalidArgument, "cannot enqueue a null chained event");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::debug("[ChainedEventRunner] Enqueued '{}'", unit->name());
    queue_.push_back(std::move(unit));
}

size_t ChainedEventRunner::advance() {
    std::vector<std::shared_ptr<ChainedEvent>> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(queue_);
    }

    std::vector<std::shared_ptr<ChainedEvent>> still_running;
    std::vector<std::shared_ptr<ChainedEvent>> successors;
    std::vector<ChainFailure> failed;
    size_t completed = 0;

    for (auto& unit : batch) {
        ChainState state = unit->advance();
        switch (state) {
            case ChainState::Completed:
                ++completed;
                spdlog::debug("[ChainedEventRunner] '{}' completed after {} steps",
                              unit->name(), unit->stepsTaken());
                if (unit->next()) {
                    successors.push_back(unit->next());
                }
                break;
            case ChainState::Failed:
                spdlog::warn("[ChainedEventRunner] '{}' failed: {}", unit->name(), unit->failureReason());
                failed.push_back(ChainFailure{unit->name(), unit->failureReason()});
                break;
            default:
                still_running.push_back(std::move(unit));
                break;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // Keep order: units still running, anything enqueued during this pass, then successors
    still_running.insert(still_running.end(), queue_.begin(), queue_.end());
    still_running.insert(still_running.end(), successors.begin(), successors.end());
    queue_.swap(still_running);
    failures_.insert(failures_.end(), failed.begin(), failed.end());
    completed_ += completed;

    return batch.size();
}

size_t ChainedEventRunner::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t ChainedEventRunner::completedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

std::vector<ChainFailure> ChainedEventRunner::failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

void ChainedEventRunner::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::info("[ChainedEventRunner] Cleared {} pending units", queue_.size());
    queue_.clear();
    failures_.clear();
}

} // namespace PoolDispatch
