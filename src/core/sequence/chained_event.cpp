#include <pooldispatch/core/sequence/chained_event.hpp>
#include <pooldispatch/core/common/errors.hpp>

namespace PoolDispatch {

const char* toString(ChainState state) {
    switch (state) {
        case ChainState::NotStarted: return "NOT_STARTED";
        case ChainState::Running:    return "RUNNING";
        case ChainState::Completed:  return "COMPLETED";
        case ChainState::Failed:     return "FAILED";
        default:                     return "UNKNOWN";
    }
}

ChainedEvent::ChainedEvent(std::string name)
    : name_(std::move(name)) {}

ChainState ChainedEvent::advance() {
    if (finished()) {
        return state_;
    }

    StepResult result = StepResult::Fail;
    try {
        if (state_ == ChainState::NotStarted) {
            state_ = ChainState::Running;
            onStart();
        }
        ++steps_;
        result = step();
    } catch (const std::exception& e) {
        failure_reason_ = e.what();
        result = StepResult::Fail;
    } catch (...) {
        failure_reason_ = "non-standard exception";
        result = StepResult::Fail;
    }

    switch (result) {
        case StepResult::Continue:
            break;
        case StepResult::Done:
            state_ = ChainState::Completed;
            break;
        case StepResult::Fail:
        default:
            if (failure_reason_.empty()) {
                failure_reason_ = "step reported failure";
            }
            state_ = ChainState::Failed;
            break;
    }
    return state_;
}

std::shared_ptr<ChainedEvent> ChainedEvent::then(std::shared_ptr<ChainedEvent> successor) {
    next_ = std::move(successor);
    return next_;
}

FunctionStep::FunctionStep(std::string name, StepFn fn)
    : ChainedEvent(std::move(name)), fn_(std::move(fn)) {
    if (!fn_) {
        throw CoreError(Errc::NullCallback, "FunctionStep '" + this->name() + "' needs a callable");
    }
}

StepResult FunctionStep::step() {
    return fn_();
}

DelayStep::DelayStep(std::string name, size_t ticks)
    : ChainedEvent(std::move(name)), ticks_(ticks) {}

StepResult DelayStep::step() {
    if (elapsed_ < ticks_) {
        ++elapsed_;
    }
    return elapsed_ >= ticks_ ? StepResult::Done : StepResult::Continue;
}

} // namespace PoolDispatch
