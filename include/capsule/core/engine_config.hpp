/**
 * @file engine_config.hpp
 * @brief Execution engine limits and sizing
 * 
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>

namespace capsule {
namespace core {

/**
 * @struct EngineConfig
 * @brief Limits applied to every invocation plus engine sizing
 * 
 * The script timeout bounds any single synchronous slice of program code;
 * the overall timeout bounds the whole invocation including awaited
 * capability calls and must be strictly larger.
 */
struct EngineConfig {
    // Time Bounds
    std::chrono::milliseconds script_timeout{30000};    ///< Synchronous slice budget
    std::chrono::milliseconds overall_timeout{35000};   ///< Whole-invocation budget

    // Memory Bounds
    std::size_t memory_limit_mb{512};        ///< Heap limit per isolate
    std::size_t max_stack_kb{1024};          ///< Native stack limit per isolate

    // Sizing
    std::size_t pool_size{4};                ///< Isolates kept for reuse (and max concurrency)
    std::size_t dispatcher_threads{8};       ///< Host threads serving capability calls

    // Payload Limits
    std::size_t max_program_bytes{256 * 1024};   ///< Largest accepted program
    std::size_t max_output_bytes{1024 * 1024};   ///< Output cap before truncation

    bool verbose_logging{false};             ///< Debug-level engine logging
};

/**
 * @brief Check an engine configuration
 * @throws std::invalid_argument naming the first invalid setting
 */
void ValidateEngineConfig(const EngineConfig& config);

/**
 * @brief Load configuration overrides from a JSON file
 * 
 * Recognized keys: `scriptTimeoutMs`, `overallTimeoutMs`, `memoryLimitMb`,
 * `maxStackKb`, `poolSize`, `dispatcherThreads`, `maxProgramBytes`,
 * `maxOutputBytes`, `verbose`. Missing keys keep the value from @p base.
 * 
 * @param path JSON file
 * @param base Values for keys the file omits
 * @return Validated configuration
 * 
 * @throws std::runtime_error if the file cannot be read or parsed
 * @throws std::invalid_argument if the result is invalid
 */
EngineConfig LoadEngineConfig(const std::filesystem::path& path,
                              const EngineConfig& base = EngineConfig{});

} // namespace core
} // namespace capsule
