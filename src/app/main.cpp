#include <spdlog/spdlog.h>
#include <pooldispatch/core/config/loader.hpp>
#include <pooldispatch/core/events/scoped_subscriptions.hpp>
#include <pooldispatch/core/runtime/core_context.hpp>
#include <pooldispatch/core/sequence/chained_event.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace PoolDispatch;

// Global flag for graceful shutdown
static std::atomic<bool> g_running{true};

void signal_handler(int signum) {
    spdlog::info("Signal {} received, shutting down...", signum);
    g_running.store(false, std::memory_order_release);
}

namespace {

// Stand-in for a particle system instance: plays for a number of frames
struct SimulatedEffect {
    uint32_t frames_left{0};
    bool playing{false};

    void play(uint32_t frames) {
        frames_left = frames;
        playing = true;
    }
    void update() {
        if (playing && frames_left > 0 && --frames_left == 0) {
            playing = false;
        }
    }
    void stop() {
        playing = false;
        frames_left = 0;
    }
};

struct Damaged {
    int amount;
    std::string source;
};

struct WaveAnnounced {
    int wave;
};

// UI element that listens only while it exists
class HealthBar {
public:
    explicit HealthBar(EventDispatcher& dispatcher) : subs_(dispatcher) {
        subs_.subscribe<Damaged>([this](const Damaged& e) {
            health_ -= e.amount;
            spdlog::info("[HealthBar] -{} from {} (health {})", e.amount, e.source, health_);
        }, Priority::Normal, DispatchMode::Sync, "health_bar");
        subs_.subscribe<WaveAnnounced>([](const WaveAnnounced& e) {
            spdlog::info("[HealthBar] Wave {} incoming", e.wave);
        }, Priority::Low, DispatchMode::Sync, "health_bar_wave");
    }

private:
    ScopedSubscriptions subs_;
    int health_{100};
};

PoolRegistry<SimulatedEffect>::Hooks effectHooks() {
    PoolRegistry<SimulatedEffect>::Hooks hooks;
    hooks.onRelease = [](SimulatedEffect& fx) { fx.stop(); };
    hooks.isAlive = [](const SimulatedEffect& fx) { return fx.playing; };
    return hooks;
}

void logStats(PoolRegistry<SimulatedEffect>& effects) {
    for (const auto& key : effects.keys()) {
        PoolStats s = effects.stats(key);
        spdlog::info("  pool '{}': idle={} active={} total={} capacity={}",
                     key, s.idle, s.active, s.total, s.capacity);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("PoolDispatchCore demo version 1.0.0 starting up...");

    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Config file: {}", configPath);

    AppConfig::AppConfiguration config;
    try {
        config = ConfigLoader::loadConfig(configPath);
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to load configuration: {}", e.what());
        return EXIT_FAILURE;
    }
    ConfigLoader::applyLogging(config.logging);
    spdlog::info("Configuration loaded successfully.");

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    CoreContext::Options options;
    options.max_recorded_failures = config.dispatcher.max_recorded_failures;
    CoreContext context(options);

    auto& effects = context.pools<SimulatedEffect>("EffectPools");
    auto& dispatcher = context.dispatcher();

    try {
        for (const auto& pool : config.pools) {
            effects.createPool(pool, [] { return std::make_unique<SimulatedEffect>(); }, effectHooks());
        }
    } catch (const CoreError& e) {
        spdlog::error("Failed to create pools: {}", e.what());
        return EXIT_FAILURE;
    }

    dispatcher.subscribe<Damaged>([](const Damaged& e) {
        spdlog::info("[Combat] Critical handler saw {} damage", e.amount);
    }, Priority::Critical, kNoScope, DispatchMode::Sync, "combat");

    dispatcher.subscribe<Damaged>([](const Damaged& e) {
        spdlog::info("[Analytics] (deferred) recorded {} damage from {}", e.amount, e.source);
    }, Priority::Background, kNoScope, DispatchMode::Deferred, "analytics");

    dispatcher.subscribe<Damaged>([](const Damaged& e) {
        if (e.amount > 40) {
            throw std::runtime_error("overkill not supported");
        }
    }, Priority::High, kNoScope, DispatchMode::Sync, "fragile_listener");

    auto healthBar = std::make_unique<HealthBar>(dispatcher);

    // Intro sequence: wait, spawn a burst, hold, announce
    const std::string burstKey = config.pools.empty() ? std::string() : config.pools.back().key;
    std::vector<PoolHandle> spawned;

    auto intro = std::make_shared<DelayStep>("fade_in", 10);
    intro->then(std::make_shared<FunctionStep>("spawn_burst", [&]() {
        if (burstKey.empty()) {
            return StepResult::Done;
        }
        for (int i = 0; i < 3; ++i) {
            PoolHandle h = effects.acquireWithTimeout(burstKey, std::chrono::milliseconds(500));
            effects.get(h).play(40);
            spawned.push_back(h);
        }
        return StepResult::Done;
    }))->then(std::make_shared<DelayStep>("hold", 20))
      ->then(std::make_shared<FunctionStep>("announce", [&]() {
        dispatcher.publish(WaveAnnounced{1});
        return StepResult::Done;
    }));
    context.chains().enqueue(intro);

    spdlog::info("Initialization complete. Running {} ticks...", config.runtime.demo_ticks);

    const auto interval = std::chrono::milliseconds(config.runtime.tick_interval_ms);
    for (uint32_t frame = 0; frame < config.runtime.demo_ticks && g_running.load(std::memory_order_acquire); ++frame) {
        try {
            if (frame % 15 == 0 && !config.pools.empty()) {
                const std::string& key = config.pools.front().key;
                PoolHandle h = effects.acquire(key);
                effects.get(h).play(12 + frame % 20);
                spawned.push_back(h);
                dispatcher.publish(Damaged{static_cast<int>(10 + frame % 50), key});
            }
        } catch (const CoreError& e) {
            spdlog::warn("Frame {}: {}", frame, e.what());
        }

        for (const auto& h : spawned) {
            if (effects.isActive(h)) {
                effects.get(h).update();
            }
        }

        if (frame == config.runtime.demo_ticks / 2) {
            spdlog::info("Destroying health bar (scope teardown)");
            healthBar.reset();
        }

        TickReport report = context.tick();
        if (report.handles_reclaimed > 0) {
            spdlog::debug("Frame {}: reclaimed {} effects", frame, report.handles_reclaimed);
        }

        std::this_thread::sleep_for(interval);
    }

    spdlog::info("Shutting down...");
    logStats(effects);
    spdlog::info("Callback failures: {}", dispatcher.failures().totalFailures());
    for (const auto& failure : context.chains().failures()) {
        spdlog::warn("Chain step '{}' failed: {}", failure.name, failure.reason);
    }

    healthBar.reset();
    effects.clearAll();
    spdlog::info("Shutdown complete");
    return EXIT_SUCCESS;
}
