#pragma once
#include <pooldispatch/core/events/event_dispatcher.hpp>
#include <pooldispatch/core/memory/pool_registry.hpp>
#include <pooldispatch/core/memory/reclaimable.hpp>
#include <pooldispatch/core/sequence/chained_event_runner.hpp>
#include <pooldispatch/core/utils/clock.hpp>
#include <pooldispatch/core/utils/task_scheduler.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace PoolDispatch {

struct TickReport {
    size_t tasks_run{0};
    size_t handles_reclaimed{0};
    size_t chain_steps{0};
};

/**
 * CoreContext - one session's pools, dispatcher and sequencing
 *
 * Replaces process-wide statics with an object the host constructs, passes
 * around and destroys. The host drives it by calling tick() once per frame.
 *
 * tick(now) order:
 *   1. scheduler: deferred deliveries and timed releases that are due
 *   2. reclaimFinished() on every registered pool registry
 *   3. one advance() of the chained event runner
 */
class CoreContext {
public:
    struct Options {
        size_t max_recorded_failures = CallbackFailureLog::kDefaultCapacity;
        uint64_t start_ms = Clock::now_ms();
    };

    CoreContext();
    explicit CoreContext(const Options& options);
    ~CoreContext();

    CoreContext(const CoreContext&) = delete;
    CoreContext& operator=(const CoreContext&) = delete;

    TaskScheduler& scheduler() { return scheduler_; }
    EventDispatcher& dispatcher() { return dispatcher_; }
    ChainedEventRunner& chains() { return chains_; }

    /**
     * Registry for resources of type Resource, created on first use, wired to
     * this context's scheduler and swept by tick().
     */
    template<typename Resource>
    PoolRegistry<Resource>& pools(const std::string& name = "PoolRegistry") {
        std::lock_guard<std::mutex> lock(mutex_);
        std::type_index type(typeid(Resource));
        auto it = owned_registries_.find(type);
        if (it == owned_registries_.end()) {
            auto registry = std::make_unique<PoolRegistry<Resource>>(name, &scheduler_);
            reclaimers_.push_back(registry.get());
            it = owned_registries_.emplace(type, std::move(registry)).first;
        }
        return static_cast<PoolRegistry<Resource>&>(*it->second);
    }

    // Sweep an externally owned reclaimer as well; it must outlive this context
    // or be unregistered first
    void registerReclaimer(Reclaimable& reclaimer);
    bool unregisterReclaimer(Reclaimable& reclaimer);

    TickReport tick(uint64_t now_ms);
    TickReport tick() { return tick(Clock::now_ms()); }

    uint64_t tickCount() const;

private:
    TaskScheduler scheduler_;
    EventDispatcher dispatcher_;
    ChainedEventRunner chains_;

    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::unique_ptr<Reclaimable>> owned_registries_;
    std::vector<Reclaimable*> reclaimers_;
    uint64_t ticks_{0};
};

} // namespace PoolDispatch
