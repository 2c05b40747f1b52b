/**
 * @file execution_types.hpp
 * @brief Records exchanged across the engine boundary
 * 
 * ExecutionContext is what the caller hands in with every program;
 * ExecutionResult is the only thing that ever comes back out.
 * 
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace capsule {
namespace core {

/**
 * @struct ExecutionContext
 * @brief Immutable per-invocation identifiers
 * 
 * Bound read-only into the execution scope and captured by value on the
 * host side. Every capability call is scoped to @c project_id no matter
 * what identifiers the program passes.
 */
struct ExecutionContext {
    std::string project_id;                  ///< Required tenant scope
    std::optional<std::string> meeting_id;   ///< Meeting the program acts on behalf of
    std::optional<std::string> user_id;      ///< Acting user, recorded on created rows
};

/**
 * @enum ErrorKind
 * @brief Failure taxonomy of a single invocation
 * 
 * Capability failures do not appear here: a rejected capability call is
 * either handled by the program or becomes a RUNTIME error.
 */
enum class ErrorKind {
    NONE,             ///< Invocation succeeded
    INVALID_REQUEST,  ///< Missing program text or project scope
    COMPILE,          ///< Program text is not valid syntax
    RUNTIME,          ///< Uncaught exception or unhandled capability rejection
    TIMEOUT,          ///< Script-level or overall time budget exhausted
    RESOURCE_LIMIT,   ///< Isolated environment exceeded its memory bound
    INTERNAL          ///< Host-side failure outside the program's control
};

/**
 * @enum RunState
 * @brief Program runner lifecycle
 * 
 * COMPILING -> RUNNING -> {COMPLETED, FAILED, TIMED_OUT};
 * COMPILING -> FAILED on syntax errors.
 */
enum class RunState {
    COMPILING,
    RUNNING,
    COMPLETED,
    FAILED,
    TIMED_OUT
};

/**
 * @struct ExecutionResult
 * @brief Normalized outcome of one invocation
 * 
 * Serialized as `{success, output, error?, executionTimeMs}`.
 * @c error_kind is host-side only and is not part of the JSON contract.
 */
struct ExecutionResult {
    bool success{false};                 ///< Program ran to completion
    std::string output;                  ///< Log lines joined by '\n'
    std::optional<std::string> error;    ///< Present only when success == false
    std::int64_t execution_time_ms{0};   ///< Wall-clock time since invocation start
    ErrorKind error_kind{ErrorKind::NONE};
};

const char* ToString(ErrorKind kind);
const char* ToString(RunState state);

} // namespace core
} // namespace capsule
