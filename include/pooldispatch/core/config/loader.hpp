#pragma once
#include <pooldispatch/core/config/app_config.hpp>
#include <string>

class ConfigLoader {
public:
    // Throws std::runtime_error on missing file, bad YAML, missing field, wrong type or invalid value
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);

    // Apply level and pattern to the default spdlog logger
    static void applyLogging(const AppConfig::LoggingConfig& logging);
};
