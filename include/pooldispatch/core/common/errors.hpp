#pragma once
#include <stdexcept>
#include <string>

namespace PoolDispatch {

/**
 * Error taxonomy shared by the pool registry, the dispatcher and the scheduler.
 *
 * Caller errors (bad key, capacity exceeded, empty callback) are thrown as
 * CoreError. CallbackFailure is only ever recorded, never thrown to a publisher.
 */
enum class Errc {
    DuplicateKey,
    UnknownPool,
    UnknownHandle,
    PoolExhausted,
    NullCallback,
    CallbackFailure,
    InvalidArgument,
    MissingExecutor
};

const char* toString(Errc code);

class CoreError : public std::runtime_error {
public:
    CoreError(Errc code, const std::string& message);

    Errc code() const noexcept { return code_; }

private:
    Errc code_;
};

} // namespace PoolDispatch
