#include <pooldispatch/core/events/event_dispatcher.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace PoolDispatch {

EventDispatcher::EventDispatcher(TaskScheduler* scheduler, size_t max_recorded_failures)
    : scheduler_(scheduler),
      failures_(max_recorded_failures),
      lifetime_(std::make_shared<EventDispatcher*>(this)) {
    spdlog::debug("[EventDispatcher] Initialized (deferred mode {})",
                  scheduler_ ? "available" : "unavailable");
}

EventDispatcher::~EventDispatcher() {
    lifetime_.reset();
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::debug("[EventDispatcher] Destroyed with {} subscriptions", index_.size());
}

SubscriptionId EventDispatcher::addEntry(std::type_index type, Entry entry) {
    if (entry.mode == DispatchMode::Deferred && scheduler_ == nullptr) {
        throw CoreError(Errc::MissingExecutor, "deferred subscription requires a scheduler");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entry.id = next_id_++;
    SubscriptionId id = entry.id;
    ScopeId scope = entry.scope;
    Priority priority = entry.priority;

    // Insert after every entry with the same or better priority
    auto& list = subscribers_[type];
    auto pos = std::upper_bound(list.begin(), list.end(), priority,
        [](Priority p, const Entry& e) {
            return static_cast<uint8_t>(p) < static_cast<uint8_t>(e.priority);
        });
    list.insert(pos, std::move(entry));

    index_.emplace(id, type);
    if (scope != kNoScope) {
        scopes_[scope].insert(id);
    }

    spdlog::debug("[EventDispatcher] Subscription {} added for {} at {}",
                  id, type.name(), toString(priority));
    return id;
}

bool EventDispatcher::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return removeLocked(id, true);
}

size_t EventDispatcher::unsubscribeScope(ScopeId scope) {
    if (scope == kNoScope) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = scopes_.find(scope);
    if (it == scopes_.end()) {
        return 0;
    }

    size_t removed = 0;
    for (SubscriptionId id : it->second) {
        if (removeLocked(id, false)) {
            ++removed;
        }
    }
    scopes_.erase(it);

    spdlog::debug("[EventDispatcher] Scope {} torn down ({} subscriptions removed)",
                  scope, removed);
    return removed;
}

bool EventDispatcher::removeLocked(SubscriptionId id, bool erase_from_scope) {
    auto idx = index_.find(id);
    if (idx == index_.end()) {
        return false;
    }

    auto sub = subscribers_.find(idx->second);
    if (sub != subscribers_.end()) {
        auto& list = sub->second;
        auto pos = std::find_if(list.begin(), list.end(),
                                [id](const Entry& e) { return e.id == id; });
        if (pos != list.end()) {
            if (erase_from_scope && pos->scope != kNoScope) {
                auto scope = scopes_.find(pos->scope);
                if (scope != scopes_.end()) {
                    scope->second.erase(id);
                    if (scope->second.empty()) {
                        scopes_.erase(scope);
                    }
                }
            }
            list.erase(pos);
        }
        if (list.empty()) {
            subscribers_.erase(sub);
        }
    }

    index_.erase(idx);
    return true;
}

std::vector<EventDispatcher::Entry> EventDispatcher::snapshot(std::type_index type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(type);
    if (it == subscribers_.end()) {
        return {};
    }
    return it->second;
}

size_t EventDispatcher::countFor(std::type_index type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(type);
    return it == subscribers_.end() ? 0 : it->second.size();
}

size_t EventDispatcher::deliver(const char* type_name, const std::vector<Entry>& entries,
                                const void* event, const std::shared_ptr<const void>& deferred_copy) {
    size_t invoked = 0;

    for (const auto& entry : entries) {
        if (entry.mode == DispatchMode::Sync) {
            invokeGuarded(entry, type_name, event, false);
            ++invoked;
            continue;
        }

        std::weak_ptr<EventDispatcher*> alive = lifetime_;
        scheduler_->post([alive, entry, deferred_copy, type_name]() {
            auto self = alive.lock();
            if (!self) {
                return;
            }
            EventDispatcher* dispatcher = *self;
            if (!dispatcher->isSubscribed(entry.id)) {
                spdlog::debug("[EventDispatcher] Skipping deferred delivery to removed subscription {}",
                              entry.id);
                return;
            }
            dispatcher->invokeGuarded(entry, type_name, deferred_copy.get(), true);
        });
    }

    return invoked;
}

void EventDispatcher::invokeGuarded(const Entry& entry, const char* type_name,
                                    const void* event, bool deferred) {
    std::string message;
    try {
        (*entry.callback)(event);
        return;
    } catch (const std::exception& e) {
        message = e.what();
    } catch (...) {
        message = "non-standard exception";
    }

    spdlog::warn("[EventDispatcher] Subscriber {} ('{}') failed on {}{}: {}",
                 entry.id, entry.label, type_name, deferred ? " (deferred)" : "", message);

    CallbackFailureRecord record;
    record.event_type = type_name;
    record.subscription_id = entry.id;
    record.label = entry.label;
    record.message = std::move(message);
    record.deferred = deferred;
    failures_.record(std::move(record));
}

size_t EventDispatcher::totalSubscribers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

size_t EventDispatcher::scopeSize(ScopeId scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = scopes_.find(scope);
    return it == scopes_.end() ? 0 : it->second.size();
}

bool EventDispatcher::isSubscribed(SubscriptionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(id) != 0;
}

void EventDispatcher::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = index_.size();
    subscribers_.clear();
    index_.clear();
    scopes_.clear();
    spdlog::info("[EventDispatcher] Cleared {} subscriptions", removed);
}

} // namespace PoolDispatch
