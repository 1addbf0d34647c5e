#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <pooldispatch/core/events/event_dispatcher.hpp>
#include <pooldispatch/core/memory/pool_registry.hpp>

using namespace PoolDispatch;

/**
 * Benchmark: pooled acquire/release vs plain allocation, and publish cost
 *
 * Test 1: new/delete per effect (baseline)
 * Test 2: PoolRegistry acquire/release (mutex + FIFO idle queue)
 * Test 3: EventDispatcher publish to N sync subscribers
 */

struct BenchEffect {
    std::vector<float> particles = std::vector<float>(64, 0.0f);
    uint32_t frames{0};
};

struct BenchEvent {
    int value;
};

static void printResult(const std::string& title, int iterations, std::chrono::nanoseconds elapsed) {
    long long ns_elapsed = elapsed.count() > 0 ? static_cast<long long>(elapsed.count()) : 1;
    std::cout << "\n=== " << title << " ===" << std::endl;
    std::cout << "Iterations:       " << iterations << std::endl;
    std::cout << "Total time:       " << std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() << " ms" << std::endl;
    std::cout << "Throughput:       " << (iterations * 1000000000LL) / ns_elapsed << " ops/sec" << std::endl;
    std::cout << "Avg per op:       " << ns_elapsed / iterations << " ns" << std::endl;
}

void benchmark_without_pool(int iterations) {
    long long sink = 0;
    auto start_time = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; ++i) {
        auto fx = std::make_unique<BenchEffect>();  // ALLOCATION
        fx->frames = static_cast<uint32_t>(i);
        sink += fx->frames;
    }

    auto elapsed = std::chrono::high_resolution_clock::now() - start_time;
    printResult("WITHOUT POOL (new/delete)", iterations,
                std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed));
    std::cout << "Checksum:         " << sink << std::endl;
}

void benchmark_with_pool(int iterations) {
    PoolRegistry<BenchEffect> registry("BenchPools");
    registry.createPool("fx", [] { return std::make_unique<BenchEffect>(); }, 64, 64, 0, false);

    auto start_time = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; ++i) {
        PoolHandle h = registry.acquire("fx");
        registry.get(h).frames = static_cast<uint32_t>(i);
        registry.release(h);
    }

    auto elapsed = std::chrono::high_resolution_clock::now() - start_time;
    printResult("WITH POOL REGISTRY", iterations,
                std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed));

    PoolStats s = registry.stats("fx");
    std::cout << "Pool total:       " << s.total << " (idle " << s.idle << ")" << std::endl;
}

void benchmark_publish(int iterations, int subscribers) {
    EventDispatcher dispatcher;
    long long sink = 0;
    for (int i = 0; i < subscribers; ++i) {
        dispatcher.subscribe<BenchEvent>([&sink](const BenchEvent& e) { sink += e.value; },
                                         static_cast<Priority>(i % 5));
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; ++i) {
        dispatcher.publish(BenchEvent{i & 0xFF});
    }

    auto elapsed = std::chrono::high_resolution_clock::now() - start_time;
    printResult("PUBLISH TO " + std::to_string(subscribers) + " SUBSCRIBERS", iterations,
                std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed));
    std::cout << "Checksum:         " << sink << std::endl;
}

int main() {
    spdlog::set_level(spdlog::level::warn);

    std::cout << "╔════════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║  POOL REGISTRY / DISPATCHER BENCHMARK                      ║" << std::endl;
    std::cout << "║  Comparing new/delete vs pooled effects, publish fan-out   ║" << std::endl;
    std::cout << "╚════════════════════════════════════════════════════════════╝" << std::endl;

    int iterations = 1000000;
    std::cout << "\nRunning with " << iterations << " iterations..." << std::endl;

    benchmark_without_pool(iterations);
    benchmark_with_pool(iterations);
    benchmark_publish(iterations / 10, 8);
    benchmark_publish(iterations / 10, 64);

    return 0;
}
