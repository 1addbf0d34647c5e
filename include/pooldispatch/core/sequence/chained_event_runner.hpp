#pragma once
#include <pooldispatch/core/sequence/chained_event.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace PoolDispatch {

struct ChainFailure {
    std::string name;
    std::string reason;
};

/**
 * Drives chained events without blocking the host thread.
 *
 * advance() polls every unit enqueued before the call exactly once:
 * - Running units stay queued
 * - Completed units are dropped and their successor is queued for the
 *   next advance()
 * - Failed units are recorded in failures(); their successor never runs
 *
 * Units run with no lock held, so a step may enqueue more work.
 */
class ChainedEventRunner {
public:
    ChainedEventRunner() = default;
    ~ChainedEventRunner() = default;

    ChainedEventRunner(const ChainedEventRunner&) = delete;
    ChainedEventRunner& operator=(const ChainedEventRunner&) = delete;

    // @throws CoreError(InvalidArgument) for a null unit
    void enqueue(std::shared_ptr<ChainedEvent> unit);

    // @return Number of units stepped
    size_t advance();

    size_t pending() const;
    size_t completedCount() const;
    std::vector<ChainFailure> failures() const;

    // Drop queued units and recorded failures
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<ChainedEvent>> queue_;
    std::vector<ChainFailure> failures_;
    size_t completed_{0};
};

} // namespace PoolDispatch
