#include <pooldispatch/core/runtime/core_context.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace PoolDispatch {

CoreContext::CoreContext()
    : CoreContext(Options{}) {}

CoreContext::CoreContext(const Options& options)
    : scheduler_(options.start_ms),
      dispatcher_(&scheduler_, options.max_recorded_failures) {
    spdlog::info("[CoreContext] Initialized at t={}ms", options.start_ms);
}

CoreContext::~CoreContext() {
    spdlog::info("[CoreContext] Shutting down after {} ticks", ticks_);
    std::lock_guard<std::mutex> lock(mutex_);
    reclaimers_.clear();
    owned_registries_.clear();
}

void CoreContext::registerReclaimer(Reclaimable& reclaimer) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(reclaimers_.begin(), reclaimers_.end(), &reclaimer) != reclaimers_.end()) {
        return;
    }
    reclaimers_.push_back(&reclaimer);
    spdlog::debug("[CoreContext] Registered reclaimer '{}'", reclaimer.name());
}

bool CoreContext::unregisterReclaimer(Reclaimable& reclaimer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(reclaimers_.begin(), reclaimers_.end(), &reclaimer);
    if (it == reclaimers_.end()) {
        return false;
    }
    reclaimers_.erase(it);
    return true;
}

TickReport CoreContext::tick(uint64_t now_ms) {
    TickReport report;
    report.tasks_run = scheduler_.runDue(now_ms);

    std::vector<Reclaimable*> reclaimers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reclaimers = reclaimers_;
        ++ticks_;
    }
    for (Reclaimable* reclaimer : reclaimers) {
        report.handles_reclaimed += reclaimer->reclaimFinished();
    }

    report.chain_steps = chains_.advance();
    return report;
}

uint64_t CoreContext::tickCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ticks_;
}

} // namespace PoolDispatch
