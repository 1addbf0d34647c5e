#pragma once
#include <pooldispatch/core/common/errors.hpp>
#include <pooldispatch/core/common/priority.hpp>
#include <pooldispatch/core/events/callback_failure_log.hpp>
#include <pooldispatch/core/utils/task_scheduler.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace PoolDispatch {

enum class DispatchMode : uint8_t {
    Sync = 0,      // invoked inline during publish()
    Deferred = 1   // posted to the scheduler, runs on the next tick
};

using SubscriptionId = uint64_t;
using ScopeId = const void*;   // owner identity, usually the owner's address

constexpr SubscriptionId kInvalidSubscription = 0;
constexpr ScopeId kNoScope = nullptr;

/**
 * @class EventDispatcher
 * @brief Synchronous, priority-ordered publish/subscribe keyed by payload type.
 *
 * Each event type has its own subscriber list ordered by Priority
 * (Critical first), ties kept in subscription order.
 *
 * publish() works on a snapshot of the list, so callbacks may subscribe or
 * unsubscribe while being invoked without disturbing the running delivery.
 * A callback that throws is logged and recorded in failures(); remaining
 * subscribers still receive the event.
 *
 * Subscribing the same callable twice creates two independent subscriptions.
 *
 * Thread-safety: tables are guarded by one mutex; callbacks run unlocked.
 */
class EventDispatcher {
public:
    explicit EventDispatcher(TaskScheduler* scheduler = nullptr,
                             size_t max_recorded_failures = CallbackFailureLog::kDefaultCapacity);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    /**
     * @brief Register a callback for events of type Event
     * @param scope Owner whose unsubscribeScope() removes this subscription
     * @param label Free-form name used when reporting failures
     * @throws CoreError(NullCallback)    callback is empty
     * @throws CoreError(MissingExecutor) Deferred mode without a scheduler
     */
    template<typename Event>
    SubscriptionId subscribe(std::function<void(const Event&)> callback,
                             Priority priority = Priority::Normal,
                             ScopeId scope = kNoScope,
                             DispatchMode mode = DispatchMode::Sync,
                             std::string label = {}) {
        if (!callback) {
            throw CoreError(Errc::NullCallback,
                            std::string("empty callback for ") + typeid(Event).name());
        }

        Entry entry;
        entry.priority = priority;
        entry.scope = scope;
        entry.mode = mode;
        entry.label = std::move(label);
        entry.callback = std::make_shared<const ErasedCallback>(
            [cb = std::move(callback)](const void* event) {
                cb(*static_cast<const Event*>(event));
            });

        return addEntry(std::type_index(typeid(Event)), std::move(entry));
    }

    /**
     * @brief Remove one subscription
     * @return false if it was not subscribed (no effect)
     */
    bool unsubscribe(SubscriptionId id);

    /**
     * @brief Remove every subscription of an owner, across all event types
     * @return Number of subscriptions removed; 0 when called again
     */
    size_t unsubscribeScope(ScopeId scope);

    /**
     * @brief Deliver an event to the current subscribers of its type
     *
     * Sync subscribers run inline in priority order. Deferred subscribers are
     * posted to the scheduler in the same order with a shared copy of the
     * event; one whose subscription is removed before the task runs is skipped.
     *
     * @return Number of sync callbacks invoked (failed ones included)
     */
    template<typename Event>
    size_t publish(const Event& event) {
        std::vector<Entry> entries = snapshot(std::type_index(typeid(Event)));
        if (entries.empty()) {
            return 0;
        }

        std::shared_ptr<const void> deferred_copy;
        for (const auto& entry : entries) {
            if (entry.mode == DispatchMode::Deferred) {
                deferred_copy = std::make_shared<const Event>(event);
                break;
            }
        }

        return deliver(typeid(Event).name(), entries, &event, deferred_copy);
    }

    template<typename Event>
    size_t subscriberCount() const {
        return countFor(std::type_index(typeid(Event)));
    }

    size_t totalSubscribers() const;
    size_t scopeSize(ScopeId scope) const;
    bool isSubscribed(SubscriptionId id) const;

    CallbackFailureLog& failures() { return failures_; }
    const CallbackFailureLog& failures() const { return failures_; }

    // Remove every subscription
    void clear();

private:
    using ErasedCallback = std::function<void(const void*)>;

    struct Entry {
        SubscriptionId id{kInvalidSubscription};
        Priority priority{Priority::Normal};
        ScopeId scope{kNoScope};
        DispatchMode mode{DispatchMode::Sync};
        std::string label;
        std::shared_ptr<const ErasedCallback> callback;
    };

    SubscriptionId addEntry(std::type_index type, Entry entry);
    std::vector<Entry> snapshot(std::type_index type) const;
    size_t countFor(std::type_index type) const;
    size_t deliver(const char* type_name, const std::vector<Entry>& entries,
                   const void* event, const std::shared_ptr<const void>& deferred_copy);
    void invokeGuarded(const Entry& entry, const char* type_name, const void* event, bool deferred);
    bool removeLocked(SubscriptionId id, bool erase_from_scope);

    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::vector<Entry>> subscribers_;
    std::unordered_map<SubscriptionId, std::type_index> index_;
    std::unordered_map<ScopeId, std::unordered_set<SubscriptionId>> scopes_;
    SubscriptionId next_id_{1};

    TaskScheduler* scheduler_;
    CallbackFailureLog failures_;

    // Deferred tasks hold a weak reference so they become no-ops once this
    // dispatcher is destroyed.
    std::shared_ptr<EventDispatcher*> lifetime_;
};

} // namespace PoolDispatch
