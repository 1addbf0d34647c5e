#pragma once
#include <pooldispatch/core/events/event_dispatcher.hpp>

namespace PoolDispatch {

/**
 * ScopedSubscriptions - owner-side teardown hook
 *
 * Embed one in any object that subscribes to events. Subscriptions made
 * through it are grouped under the object's own scope and removed when it is
 * destroyed, so the owner never leaves stale callbacks behind.
 *
 *   struct HealthBar {
 *       ScopedSubscriptions subs;
 *       explicit HealthBar(EventDispatcher& d) : subs(d) {
 *           subs.subscribe<Damaged>([this](const Damaged& e) { onDamaged(e); });
 *       }
 *   };
 *
 * The dispatcher must outlive this object.
 */
class ScopedSubscriptions {
public:
    explicit ScopedSubscriptions(EventDispatcher& dispatcher);
    ~ScopedSubscriptions();

    ScopedSubscriptions(const ScopedSubscriptions&) = delete;
    ScopedSubscriptions& operator=(const ScopedSubscriptions&) = delete;

    template<typename Event>
    SubscriptionId subscribe(std::function<void(const Event&)> callback,
                             Priority priority = Priority::Normal,
                             DispatchMode mode = DispatchMode::Sync,
                             std::string label = {}) {
        return dispatcher_.subscribe<Event>(std::move(callback), priority, scope(), mode,
                                            std::move(label));
    }

    ScopeId scope() const { return this; }

    // Live subscriptions still registered under this scope
    size_t size() const;

    // Unsubscribe everything now; the object stays usable
    size_t reset();

private:
    EventDispatcher& dispatcher_;
};

} // namespace PoolDispatch
