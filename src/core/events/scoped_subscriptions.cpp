#include <pooldispatch/core/events/scoped_subscriptions.hpp>

namespace PoolDispatch {

ScopedSubscriptions::ScopedSubscriptions(EventDispatcher& dispatcher)
    : dispatcher_(dispatcher) {}

ScopedSubscriptions::~ScopedSubscriptions() {
    dispatcher_.unsubscribeScope(scope());
}

size_t ScopedSubscriptions::size() const {
    return dispatcher_.scopeSize(scope());
}

size_t ScopedSubscriptions::reset() {
    return dispatcher_.unsubscribeScope(scope());
}

} // namespace PoolDispatch
