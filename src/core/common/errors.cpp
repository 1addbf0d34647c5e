#include <pooldispatch/core/common/errors.hpp>

namespace PoolDispatch {

const char* toString(Errc code) {
    switch (code) {
        case Errc::DuplicateKey:    return "DuplicateKey";
        case Errc::UnknownPool:     return "UnknownPool";
        case Errc::UnknownHandle:   return "UnknownHandle";
        case Errc::PoolExhausted:   return "PoolExhausted";
        case Errc::NullCallback:    return "NullCallback";
        case Errc::CallbackFailure: return "CallbackFailure";
        case Errc::InvalidArgument: return "InvalidArgument";
        case Errc::MissingExecutor: return "MissingExecutor";
        default:                    return "Unknown";
    }
}

CoreError::CoreError(Errc code, const std::string& message)
    : std::runtime_error(std::string(toString(code)) + ": " + message), code_(code) {}

} // namespace PoolDispatch
