#include <pooldispatch/core/config/loader.hpp>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <unordered_set>

namespace {

    YAML::Node requireField(const YAML::Node& parent, const char* field, const std::string& where) {
        const YAML::Node node = parent[field];
        if (!node) {
            throw std::runtime_error("Missing required field '" + std::string(field) + "' in " + where);
        }
        return node;
    }

    template<typename T>
    T readScalar(const YAML::Node& node, const std::string& field) {
        if (!node.IsScalar()) {
            throw std::runtime_error("Field '" + field + "' must be a scalar");
        }
        try {
            return node.as<T>();
        } catch (const YAML::BadConversion&) {
            throw std::runtime_error("Field '" + field + "' has invalid type");
        }
    }

    uint64_t readUnsigned(const YAML::Node& node, const std::string& field) {
        long long value = readScalar<long long>(node, field);
        if (value < 0) {
            throw std::runtime_error("Field '" + field + "' must not be negative");
        }
        return static_cast<uint64_t>(value);
    }

    template<typename T>
    T readBounded(const YAML::Node& node, const std::string& field) {
        uint64_t value = readUnsigned(node, field);
        if (value > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
            throw std::runtime_error("Field '" + field + "' is out of range: " + std::to_string(value));
        }
        return static_cast<T>(value);
    }

    void validateLogLevel(const std::string& level) {
        static const std::unordered_set<std::string> kLevels = {
            "trace", "debug", "info", "warn", "warning", "error", "critical", "off"
        };
        if (kLevels.count(level) == 0) {
            throw std::runtime_error("Invalid logging level: " + level);
        }
    }

    PoolDispatch::PoolConfig parsePool(const YAML::Node& node, size_t index) {
        const std::string where = "pools[" + std::to_string(index) + "]";
        if (!node.IsMap()) {
            throw std::runtime_error(where + " must be a mapping");
        }

        PoolDispatch::PoolConfig pool;
        pool.key = readScalar<std::string>(requireField(node, "key", where), where + ".key");
        pool.max_size = readBounded<uint32_t>(requireField(node, "max_size", where), where + ".max_size");
        if (node["initial_size"]) {
            pool.initial_size = readBounded<uint32_t>(node["initial_size"], where + ".initial_size");
        }
        if (node["expand_by"]) {
            pool.expand_by = readBounded<uint32_t>(node["expand_by"], where + ".expand_by");
        }
        if (node["auto_expand"]) {
            pool.auto_expand = readScalar<bool>(node["auto_expand"], where + ".auto_expand");
        }

        if (pool.key.empty()) {
            throw std::runtime_error(where + ".key must not be empty");
        }
        if (pool.max_size == 0) {
            throw std::runtime_error(where + ".max_size must be greater than 0");
        }
        if (pool.initial_size > pool.max_size) {
            throw std::runtime_error(where + ".initial_size exceeds max_size");
        }
        if (pool.auto_expand && pool.expand_by == 0) {
            throw std::runtime_error(where + ".auto_expand requires expand_by > 0");
        }
        return pool;
    }

} // namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    std::ifstream probe(filepath);
    if (!probe) {
        throw std::runtime_error("Config file not found: " + filepath);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse " + filepath + ": " + e.what());
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Config root must be a mapping: " + filepath);
    }

    AppConfig::AppConfiguration config;
    config.app_name = readScalar<std::string>(requireField(root, "app_name", filepath), "app_name");
    config.version = readScalar<std::string>(requireField(root, "version", filepath), "version");

    if (const YAML::Node logging = root["logging"]) {
        if (logging["level"]) {
            config.logging.level = readScalar<std::string>(logging["level"], "logging.level");
        }
        if (logging["pattern"]) {
            config.logging.pattern = readScalar<std::string>(logging["pattern"], "logging.pattern");
        }
    }
    validateLogLevel(config.logging.level);

    if (const YAML::Node dispatcher = root["dispatcher"]) {
        if (dispatcher["max_recorded_failures"]) {
            config.dispatcher.max_recorded_failures =
                readBounded<size_t>(dispatcher["max_recorded_failures"], "dispatcher.max_recorded_failures");
        }
    }
    if (config.dispatcher.max_recorded_failures == 0) {
        throw std::runtime_error("dispatcher.max_recorded_failures must be greater than 0");
    }

    if (const YAML::Node runtime = root["runtime"]) {
        if (runtime["tick_interval_ms"]) {
            config.runtime.tick_interval_ms =
                readBounded<uint32_t>(runtime["tick_interval_ms"], "runtime.tick_interval_ms");
        }
        if (runtime["demo_ticks"]) {
            config.runtime.demo_ticks =
                readBounded<uint32_t>(runtime["demo_ticks"], "runtime.demo_ticks");
        }
    }
    if (config.runtime.tick_interval_ms == 0) {
        throw std::runtime_error("runtime.tick_interval_ms must be greater than 0");
    }

    const YAML::Node pools = requireField(root, "pools", filepath);
    if (!pools.IsSequence()) {
        throw std::runtime_error("Field 'pools' must be a sequence");
    }
    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < pools.size(); ++i) {
        PoolDispatch::PoolConfig pool = parsePool(pools[i], i);
        if (!seen.insert(pool.key).second) {
            throw std::runtime_error("Duplicate pool key: " + pool.key);
        }
        config.pools.push_back(std::move(pool));
    }

    spdlog::info("Loaded config '{}' v{} with {} pools from {}",
                 config.app_name, config.version, config.pools.size(), filepath);
    return config;
}

void ConfigLoader::applyLogging(const AppConfig::LoggingConfig& logging) {
    spdlog::set_pattern(logging.pattern);
    spdlog::set_level(spdlog::level::from_str(logging.level));
}
