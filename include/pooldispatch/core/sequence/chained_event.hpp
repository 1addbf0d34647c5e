#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace PoolDispatch {

/**
 * Chained event state machine
 *
 *   NotStarted --advance()--> Running --step() Done--> Completed
 *                                     \--step() Fail / throw--> Failed
 *
 * Completed and Failed are terminal.
 */
enum class ChainState : uint8_t {
    NotStarted = 0,
    Running = 1,
    Completed = 2,
    Failed = 3
};

// Outcome of one step() call
enum class StepResult : uint8_t {
    Continue = 0,  // still working, poll again next tick
    Done = 1,
    Fail = 2
};

const char* toString(ChainState state);

/**
 * One unit of sequential work, advanced one step per tick by ChainedEventRunner.
 * On completion the runner enqueues next(); on failure the chain stops there.
 */
class ChainedEvent {
public:
    explicit ChainedEvent(std::string name);
    virtual ~ChainedEvent() = default;

    /**
     * Run one step. Called by the runner only.
     * Exceptions thrown by step() turn the unit into Failed.
     */
    ChainState advance();

    ChainState state() const { return state_; }
    bool finished() const { return state_ == ChainState::Completed || state_ == ChainState::Failed; }
    const std::string& name() const { return name_; }
    const std::string& failureReason() const { return failure_reason_; }
    size_t stepsTaken() const { return steps_; }

    const std::shared_ptr<ChainedEvent>& next() const { return next_; }

    /**
     * Link the successor, returning it so chains read left to right:
     *   a->then(b)->then(c);
     */
    std::shared_ptr<ChainedEvent> then(std::shared_ptr<ChainedEvent> successor);

protected:
    // Called once on the NotStarted -> Running transition
    virtual void onStart() {}
    virtual StepResult step() = 0;

    // Set the reason reported when step() returns Fail
    void setFailureReason(std::string reason) { failure_reason_ = std::move(reason); }

private:
    std::string name_;
    ChainState state_{ChainState::NotStarted};
    std::string failure_reason_;
    size_t steps_{0};
    std::shared_ptr<ChainedEvent> next_;
};

// Step driven by a callable
class FunctionStep : public ChainedEvent {
public:
    using StepFn = std::function<StepResult()>;

    FunctionStep(std::string name, StepFn fn);

protected:
    StepResult step() override;

private:
    StepFn fn_;
};

// Completes after a fixed number of ticks
class DelayStep : public ChainedEvent {
public:
    DelayStep(std::string name, size_t ticks);

    size_t remaining() const { return ticks_ > elapsed_ ? ticks_ - elapsed_ : 0; }

protected:
    StepResult step() override;

private:
    size_t ticks_;
    size_t elapsed_{0};
};

} // namespace PoolDispatch
