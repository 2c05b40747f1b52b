/**
 * @file engine_config.cpp
 * @brief Validation and JSON loading of engine configuration
 * 
 * @date 2025
 */

#include "capsule/core/engine_config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace capsule {
namespace core {

namespace {

template <typename T>
void ReadOverride(const json& doc, const char* key, T& target) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return;
    }
    if (!it->is_number_unsigned()) {
        throw std::invalid_argument(std::string("Configuration key '") + key +
                                    "' must be a non-negative integer");
    }
    target = it->get<T>();
}

void ReadMilliseconds(const json& doc, const char* key, std::chrono::milliseconds& target) {
    std::size_t value = static_cast<std::size_t>(target.count());
    ReadOverride(doc, key, value);
    target = std::chrono::milliseconds(value);
}

} // namespace

void ValidateEngineConfig(const EngineConfig& config) {
    if (config.script_timeout.count() <= 0) {
        throw std::invalid_argument("script_timeout must be positive");
    }
    if (config.overall_timeout <= config.script_timeout) {
        throw std::invalid_argument("overall_timeout must be greater than script_timeout");
    }
    if (config.memory_limit_mb == 0) {
        throw std::invalid_argument("memory_limit_mb must be positive");
    }
    if (config.max_stack_kb == 0) {
        throw std::invalid_argument("max_stack_kb must be positive");
    }
    if (config.pool_size == 0) {
        throw std::invalid_argument("pool_size must be at least 1");
    }
    if (config.dispatcher_threads == 0) {
        throw std::invalid_argument("dispatcher_threads must be at least 1");
    }
    if (config.max_program_bytes == 0) {
        throw std::invalid_argument("max_program_bytes must be positive");
    }
}

EngineConfig LoadEngineConfig(const std::filesystem::path& path, const EngineConfig& base) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    json doc;
    try {
        file >> doc;
    }
    catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid configuration file " + path.string() + ": " + e.what());
    }
    if (!doc.is_object()) {
        throw std::runtime_error("Configuration file must contain a JSON object: " + path.string());
    }

    EngineConfig config = base;
    ReadMilliseconds(doc, "scriptTimeoutMs", config.script_timeout);
    ReadMilliseconds(doc, "overallTimeoutMs", config.overall_timeout);
    ReadOverride(doc, "memoryLimitMb", config.memory_limit_mb);
    ReadOverride(doc, "maxStackKb", config.max_stack_kb);
    ReadOverride(doc, "poolSize", config.pool_size);
    ReadOverride(doc, "dispatcherThreads", config.dispatcher_threads);
    ReadOverride(doc, "maxProgramBytes", config.max_program_bytes);
    ReadOverride(doc, "maxOutputBytes", config.max_output_bytes);
    if (doc.contains("verbose") && doc["verbose"].is_boolean()) {
        config.verbose_logging = doc["verbose"].get<bool>();
    }

    ValidateEngineConfig(config);
    spdlog::debug("Loaded engine configuration from {}", path.string());
    return config;
}

} // namespace core
} // namespace capsule
