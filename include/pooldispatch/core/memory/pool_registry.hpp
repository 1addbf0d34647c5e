#pragma once

#include <pooldispatch/core/common/errors.hpp>
#include <pooldispatch/core/memory/pool_types.hpp>
#include <pooldispatch/core/memory/reclaimable.hpp>
#include <pooldispatch/core/utils/task_scheduler.hpp>
#include <algorithm>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <spdlog/spdlog.h>

namespace PoolDispatch {

/**
 * Optional per-pool callbacks.
 * - onAcquire: prepare a resource handed out by acquire()
 * - onRelease: stop/deactivate a resource going back to idle
 * - isAlive:   liveness predicate used by reclaimFinished(); false once the
 *              resource is safe to reuse
 */
template<typename Resource>
struct PoolHooks {
    std::function<void(Resource&)> onAcquire;
    std::function<void(Resource&)> onRelease;
    std::function<bool(const Resource&)> isAlive;
};

/**
 * PoolRegistry - named, bounded pools of reusable resources
 *
 * ┌─────────────────────────────────────────────────────────────────────┐
 * │  Every created resource is either idle or active, never both.      │
 * │  total (idle + active) never exceeds the pool's max_size.          │
 * └─────────────────────────────────────────────────────────────────────┘
 *
 * Lifecycle:
 *   1. createPool(): eagerly builds initial_size idle resources
 *   2. acquire(): reuses the oldest idle resource (FIFO), grows by
 *      expand_by when auto_expand is set and capacity remains, otherwise
 *      throws PoolExhausted
 *   3. release() / reclaimFinished() / timed auto-release: back to idle
 *   4. clear(): destroys every resource of the pool, active ones included
 *
 * Thread-safety: all operations are serialized by one mutex. Hooks and the
 * factory run under that mutex and must not call back into this registry.
 * References returned by get() stay valid while the handle remains active.
 *
 * Usage:
 *   PoolRegistry<Effect> effects("Effects", &scheduler);
 *   effects.createPool("spark", [] { return std::make_unique<Effect>(); }, 8, 32, 8, true);
 *   PoolHandle h = effects.acquire("spark");
 *   effects.get(h).play();
 *   effects.release(h);
 */
template<typename Resource>
class PoolRegistry : public Reclaimable {
public:
    using Factory = std::function<std::unique_ptr<Resource>()>;
    using Hooks = PoolHooks<Resource>;

    /**
     * @param name      Label used in logs
     * @param scheduler Executor for acquireWithTimeout(); must outlive the registry
     */
    explicit PoolRegistry(std::string name = "PoolRegistry", TaskScheduler* scheduler = nullptr)
        : name_(std::move(name)), scheduler_(scheduler) {}

    ~PoolRegistry() override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : pools_) {
            cancelTimersLocked(*entry.second);
        }
        pools_.clear();
    }

    PoolRegistry(const PoolRegistry&) = delete;
    PoolRegistry& operator=(const PoolRegistry&) = delete;

    /**
     * Register a pool and pre-allocate its idle resources
     *
     * @throws CoreError(DuplicateKey)    key already registered (never overwritten)
     * @throws CoreError(InvalidArgument) empty key/factory, max_size == 0,
     *         initial_size > max_size, auto_expand with expand_by == 0,
     *         or the factory returned null
     */
    void createPool(const std::string& key, Factory factory,
                    size_t initial_size, size_t max_size,
                    size_t expand_by, bool auto_expand, Hooks hooks = {}) {
        PoolConfig config;
        config.key = key;
        config.initial_size = initial_size;
        config.max_size = max_size;
        config.expand_by = expand_by;
        config.auto_expand = auto_expand;
        createPool(config, std::move(factory), std::move(hooks));
    }

    void createPool(const PoolConfig& config, Factory factory, Hooks hooks = {}) {
        validate(config, factory);

        std::lock_guard<std::mutex> lock(mutex_);
        if (pools_.count(config.key) != 0) {
            throw CoreError(Errc::DuplicateKey, "pool '" + config.key + "' already exists in " + name_);
        }

        auto pool = std::make_unique<Pool>();
        pool->config = config;
        pool->factory = std::move(factory);
        pool->hooks = std::move(hooks);
        pool->slots.reserve(config.initial_size);
        growLocked(*pool, config.initial_size);

        pools_.emplace(config.key, std::move(pool));
        spdlog::info("[{}] Created pool '{}' (initial={}, max={}, expand_by={}, auto_expand={})",
                     name_, config.key, config.initial_size, config.max_size,
                     config.expand_by, config.auto_expand);
    }

    /**
     * Hand out an idle resource, expanding the pool if allowed
     *
     * @throws CoreError(UnknownPool)   no pool under key
     * @throws CoreError(PoolExhausted) no idle resource and no capacity left
     */
    PoolHandle acquire(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return acquireLocked(poolOrThrow(key));
    }

    /**
     * acquire() plus an automatic release after `duration`
     *
     * A manual release() before the deadline cancels the timer. If the timer
     * fires after the handle was already returned it does nothing.
     *
     * @throws CoreError(MissingExecutor) registry has no scheduler
     */
    PoolHandle acquireWithTimeout(const std::string& key, std::chrono::milliseconds duration) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (scheduler_ == nullptr) {
            throw CoreError(Errc::MissingExecutor, name_ + " has no scheduler for timed release");
        }

        Pool& pool = poolOrThrow(key);
        PoolHandle handle = acquireLocked(pool);
        pool.slots[handle.slot].release_timer =
            scheduler_->scheduleAfter(duration, [this, handle]() {
                if (release(handle)) {
                    spdlog::debug("[{}] Auto-released '{}' slot {}", name_, handle.pool, handle.slot);
                }
            });
        return handle;
    }

    /**
     * Return an active resource to its pool
     *
     * Idempotent: releasing an already-idle, stale or foreign handle, or a
     * handle whose pool was cleared, is a no-op that returns false.
     *
     * @return true if the resource moved from active to idle
     */
    bool release(const PoolHandle& handle) {
        std::lock_guard<std::mutex> lock(mutex_);
        Pool* pool = findPool(handle.pool);
        if (pool == nullptr || !isActiveLocked(*pool, handle)) {
            spdlog::debug("[{}] Ignoring release of inactive handle '{}' slot {} gen {}",
                          name_, handle.pool, handle.slot, handle.generation);
            return false;
        }
        releaseLocked(*pool, handle.slot);
        return true;
    }

    /**
     * Borrow the resource behind an active handle
     * @throws CoreError(UnknownHandle) handle is not active
     */
    Resource& get(const PoolHandle& handle) {
        std::lock_guard<std::mutex> lock(mutex_);
        Pool* pool = findPool(handle.pool);
        if (pool == nullptr || !isActiveLocked(*pool, handle)) {
            throw CoreError(Errc::UnknownHandle,
                            "handle '" + handle.pool + "' slot " + std::to_string(handle.slot) +
                            " is not active");
        }
        return *pool->slots[handle.slot].object;
    }

    bool isActive(const PoolHandle& handle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const Pool* pool = findPool(handle.pool);
        return pool != nullptr && isActiveLocked(*pool, handle);
    }

    // Current metadata of the slot a handle points at; nullopt if the slot does not exist
    std::optional<HandleInfo> info(const PoolHandle& handle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const Pool* pool = findPool(handle.pool);
        if (pool == nullptr || handle.slot >= pool->slots.size()) {
            return std::nullopt;
        }
        const Slot& slot = pool->slots[handle.slot];
        HandleInfo result;
        result.pool = handle.pool;
        result.slot = handle.slot;
        result.generation = slot.generation;
        result.active = slot.active;
        result.auto_release_pending = slot.release_timer != TaskScheduler::kInvalidTask;
        return result;
    }

    /**
     * Destroy every resource of a pool and forget the key
     * @throws CoreError(UnknownPool)
     */
    void clear(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pools_.find(key);
        if (it == pools_.end()) {
            throw CoreError(Errc::UnknownPool, "no pool '" + key + "' in " + name_);
        }
        cancelTimersLocked(*it->second);
        size_t destroyed = it->second->slots.size();
        size_t active = it->second->active.size();
        pools_.erase(it);
        spdlog::info("[{}] Cleared pool '{}' ({} resources destroyed, {} were active)",
                     name_, key, destroyed, active);
    }

    void clearAll() {
        std::vector<std::string> all = keys();
        for (const auto& key : all) {
            clear(key);
        }
    }

    /**
     * @throws CoreError(UnknownPool)
     */
    PoolStats stats(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const Pool* pool = findPool(key);
        if (pool == nullptr) {
            throw CoreError(Errc::UnknownPool, "no pool '" + key + "' in " + name_);
        }
        PoolStats s;
        s.idle = pool->idle.size();
        s.active = pool->active.size();
        s.total = pool->slots.size();
        s.capacity = pool->config.max_size;
        return s;
    }

    bool hasPool(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pools_.count(key) != 0;
    }

    // Sorted pool keys
    std::vector<std::string> keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        result.reserve(pools_.size());
        for (const auto& entry : pools_) {
            result.push_back(entry.first);
        }
        std::sort(result.begin(), result.end());
        return result;
    }

    /**
     * Sweep: release every active resource whose isAlive predicate is false
     *
     * Pools without a predicate are skipped. A predicate that throws leaves
     * its resource active and is logged; the sweep itself never throws.
     *
     * @return Number of resources returned to idle
     */
    size_t reclaimFinished() override {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t reclaimed = 0;

        for (auto& entry : pools_) {
            Pool& pool = *entry.second;
            if (!pool.hooks.isAlive || pool.active.empty()) {
                continue;
            }

            // Copy: releaseLocked() mutates the active set
            std::vector<uint32_t> candidates(pool.active.begin(), pool.active.end());
            for (uint32_t index : candidates) {
                bool alive = true;
                try {
                    alive = pool.hooks.isAlive(*pool.slots[index].object);
                } catch (const std::exception& e) {
                    spdlog::warn("[{}] Liveness check failed for '{}' slot {}: {}",
                                 name_, entry.first, index, e.what());
                    continue;
                } catch (...) {
                    spdlog::warn("[{}] Liveness check failed for '{}' slot {}: non-standard exception",
                                 name_, entry.first, index);
                    continue;
                }
                if (!alive) {
                    releaseLocked(pool, index);
                    ++reclaimed;
                }
            }
        }

        if (reclaimed > 0) {
            spdlog::debug("[{}] Reclaimed {} finished resources", name_, reclaimed);
        }
        return reclaimed;
    }

    const std::string& name() const override { return name_; }

private:
    struct Slot {
        std::unique_ptr<Resource> object;
        uint32_t generation{0};
        bool active{false};
        TaskScheduler::TaskId release_timer{TaskScheduler::kInvalidTask};
    };

    struct Pool {
        PoolConfig config;
        Factory factory;
        Hooks hooks;
        std::vector<Slot> slots;
        std::deque<uint32_t> idle;   // FIFO: oldest returned is reused first
        std::set<uint32_t> active;
    };

    static void validate(const PoolConfig& config, const Factory& factory) {
        if (config.key.empty()) {
            throw CoreError(Errc::InvalidArgument, "pool key must not be empty");
        }
        if (!factory) {
            throw CoreError(Errc::InvalidArgument, "pool '" + config.key + "' needs a factory");
        }
        if (config.max_size == 0) {
            throw CoreError(Errc::InvalidArgument, "pool '" + config.key + "' max_size must be > 0");
        }
        if (config.initial_size > config.max_size) {
            throw CoreError(Errc::InvalidArgument,
                            "pool '" + config.key + "' initial_size exceeds max_size");
        }
        if (config.auto_expand && config.expand_by == 0) {
            throw CoreError(Errc::InvalidArgument,
                            "pool '" + config.key + "' auto_expand requires expand_by > 0");
        }
    }

    Pool* findPool(const std::string& key) {
        auto it = pools_.find(key);
        return it == pools_.end() ? nullptr : it->second.get();
    }

    const Pool* findPool(const std::string& key) const {
        auto it = pools_.find(key);
        return it == pools_.end() ? nullptr : it->second.get();
    }

    Pool& poolOrThrow(const std::string& key) {
        Pool* pool = findPool(key);
        if (pool == nullptr) {
            throw CoreError(Errc::UnknownPool, "no pool '" + key + "' in " + name_);
        }
        return *pool;
    }

    static bool isActiveLocked(const Pool& pool, const PoolHandle& handle) {
        if (handle.slot >= pool.slots.size()) {
            return false;
        }
        const Slot& slot = pool.slots[handle.slot];
        return slot.active && slot.generation == handle.generation;
    }

    void growLocked(Pool& pool, size_t count) {
        for (size_t i = 0; i < count; ++i) {
            std::unique_ptr<Resource> object = pool.factory();
            if (!object) {
                throw CoreError(Errc::InvalidArgument,
                                "factory for pool '" + pool.config.key + "' returned null");
            }
            Slot slot;
            slot.object = std::move(object);
            pool.slots.push_back(std::move(slot));
            pool.idle.push_back(static_cast<uint32_t>(pool.slots.size() - 1));
        }
    }

    PoolHandle acquireLocked(Pool& pool) {
        if (pool.idle.empty()) {
            size_t total = pool.slots.size();
            if (!pool.config.auto_expand || total >= pool.config.max_size) {
                spdlog::warn("[{}] Pool '{}' exhausted ({} / {} active)",
                             name_, pool.config.key, pool.active.size(), pool.config.max_size);
                throw CoreError(Errc::PoolExhausted,
                                "pool '" + pool.config.key + "' has no idle resources");
            }
            size_t grow = std::min(pool.config.expand_by, pool.config.max_size - total);
            growLocked(pool, grow);
            spdlog::debug("[{}] Expanded pool '{}' by {} (total {})",
                          name_, pool.config.key, grow, pool.slots.size());
        }

        uint32_t index = pool.idle.front();
        Slot& slot = pool.slots[index];
        if (pool.hooks.onAcquire) {
            // Throws before any state change, so the resource stays idle
            pool.hooks.onAcquire(*slot.object);
        }

        pool.idle.pop_front();
        pool.active.insert(index);
        slot.active = true;

        PoolHandle handle;
        handle.pool = pool.config.key;
        handle.slot = index;
        handle.generation = slot.generation;
        return handle;
    }

    void releaseLocked(Pool& pool, uint32_t index) {
        Slot& slot = pool.slots[index];
        if (slot.release_timer != TaskScheduler::kInvalidTask) {
            if (scheduler_ != nullptr) {
                scheduler_->cancel(slot.release_timer);
            }
            slot.release_timer = TaskScheduler::kInvalidTask;
        }

        if (pool.hooks.onRelease) {
            try {
                pool.hooks.onRelease(*slot.object);
            } catch (const std::exception& e) {
                spdlog::warn("[{}] onRelease hook failed for '{}' slot {}: {}",
                             name_, pool.config.key, index, e.what());
            } catch (...) {
                spdlog::warn("[{}] onRelease hook failed for '{}' slot {}: non-standard exception",
                             name_, pool.config.key, index);
            }
        }

        slot.active = false;
        ++slot.generation;
        pool.active.erase(index);
        pool.idle.push_back(index);
    }

    void cancelTimersLocked(Pool& pool) {
        if (scheduler_ == nullptr) {
            return;
        }
        for (auto& slot : pool.slots) {
            if (slot.release_timer != TaskScheduler::kInvalidTask) {
                scheduler_->cancel(slot.release_timer);
                slot.release_timer = TaskScheduler::kInvalidTask;
            }
        }
    }

    std::string name_;
    TaskScheduler* scheduler_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Pool>> pools_;
};

} // namespace PoolDispatch
