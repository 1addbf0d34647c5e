#pragma once
#include <pooldispatch/core/memory/pool_types.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace AppConfig {

    struct LoggingConfig {
        std::string level = "info";
        std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    };

    struct DispatcherConfig {
        size_t max_recorded_failures = 256;
    };

    struct RuntimeConfig {
        uint32_t tick_interval_ms = 16;
        uint32_t demo_ticks = 120;
    };

    struct AppConfiguration {
        std::string app_name;
        std::string version;
        LoggingConfig logging;
        DispatcherConfig dispatcher;
        RuntimeConfig runtime;
        std::vector<PoolDispatch::PoolConfig> pools;
    };

} // namespace AppConfig
