/**
 * @file result_translator.cpp
 * @brief Implementation of result normalization
 * 
 * @date 2025
 */

#include "capsule/core/result_translator.hpp"

using json = nlohmann::json;

namespace capsule {
namespace core {

std::int64_t ResultTranslator::ElapsedMs(std::chrono::steady_clock::time_point started) {
    auto elapsed = std::chrono::steady_clock::now() - started;
    return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

ExecutionResult ResultTranslator::Translate(const RunOutcome& outcome,
                                            const OutputCollector& output,
                                            std::chrono::steady_clock::time_point started) {
    if (outcome.state != RunState::COMPLETED) {
        ErrorKind kind = outcome.error_kind == ErrorKind::NONE ? ErrorKind::INTERNAL : outcome.error_kind;
        std::string message = outcome.error.empty() ? "Execution failed" : outcome.error;
        return Failure(kind, message, output.Text(), started);
    }

    ExecutionResult result;
    result.success = true;
    result.output = output.Text();
    result.execution_time_ms = ElapsedMs(started);
    return result;
}

ExecutionResult ResultTranslator::Failure(ErrorKind kind,
                                          const std::string& message,
                                          const std::string& output,
                                          std::chrono::steady_clock::time_point started) {
    ExecutionResult result;
    result.success = false;
    result.output = output;
    result.error = message;
    result.error_kind = kind == ErrorKind::NONE ? ErrorKind::INTERNAL : kind;
    result.execution_time_ms = ElapsedMs(started);
    return result;
}

json ResultTranslator::ToJson(const ExecutionResult& result) {
    json j;
    j["success"] = result.success;
    j["output"] = result.output;
    if (!result.success) {
        j["error"] = result.error.value_or("Execution failed");
    }
    j["executionTimeMs"] = result.execution_time_ms;
    return j;
}

std::string ResultTranslator::ToJsonString(const ExecutionResult& result, bool pretty_print) {
    json j = ToJson(result);
    return pretty_print ? j.dump(2, ' ', false, json::error_handler_t::replace)
                        : j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace core
} // namespace capsule
