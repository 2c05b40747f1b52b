/**
 * @file result_translator.hpp
 * @brief Normalizes run outcomes into the ExecutionResult contract
 * 
 * @date 2025
 */

#pragma once

#include "capsule/core/execution_types.hpp"
#include "capsule/core/output_collector.hpp"
#include "capsule/core/program_runner.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace capsule {
namespace core {

/**
 * @class ResultTranslator
 * @brief Builds ExecutionResult records and their JSON form
 * 
 * Every path out of the engine goes through here, so the record always
 * carries the collected output and a measured execution time, and
 * `error` is set exactly when `success` is false.
 */
class ResultTranslator {
public:
    /**
     * @brief Result of a run that reached a terminal state
     */
    static ExecutionResult Translate(const RunOutcome& outcome,
                                     const OutputCollector& output,
                                     std::chrono::steady_clock::time_point started);

    /**
     * @brief Result of an invocation that failed outside the program
     * 
     * @param kind Failure class (never NONE)
     * @param message Error message reported to the caller
     * @param output Output collected before the failure
     */
    static ExecutionResult Failure(ErrorKind kind,
                                   const std::string& message,
                                   const std::string& output,
                                   std::chrono::steady_clock::time_point started);

    /**
     * @brief `{success, output, error?, executionTimeMs}`
     */
    static nlohmann::json ToJson(const ExecutionResult& result);

    static std::string ToJsonString(const ExecutionResult& result, bool pretty_print = false);

    /// Milliseconds elapsed since @p started
    static std::int64_t ElapsedMs(std::chrono::steady_clock::time_point started);
};

} // namespace core
} // namespace capsule
