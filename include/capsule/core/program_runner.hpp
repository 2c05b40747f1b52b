/**
 * @file program_runner.hpp
 * @brief Drives one program through its lifecycle inside a leased isolate
 * 
 * The runner owns the invocation's event loop:
 * 
 * ```
 * COMPILING --syntax error--> FAILED
 *     |
 *  RUNNING --program resolves--> COMPLETED
 *     |   --program rejects----> FAILED
 *     |   --budget exhausted---> TIMED_OUT
 *     v
 *  drain jobs -> poll program -> wait on channel (until deadline) -> settle
 * ```
 * 
 * @date 2025
 */

#pragma once

#include "capsule/bridge/host_dispatcher.hpp"
#include "capsule/capabilities/scoped_capabilities.hpp"
#include "capsule/core/engine_config.hpp"
#include "capsule/core/execution_types.hpp"
#include "capsule/core/isolate_pool.hpp"
#include "capsule/core/output_collector.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace capsule {
namespace core {

/**
 * @struct RunOutcome
 * @brief Terminal state of one run, before translation
 */
struct RunOutcome {
    RunState state{RunState::COMPILING};   ///< Terminal state reached
    ErrorKind error_kind{ErrorKind::NONE}; ///< Failure class when not COMPLETED
    std::string error;                     ///< Failure message
    std::uint64_t capability_calls{0};     ///< Calls started by the program
    std::uint64_t abandoned_calls{0};      ///< Calls unsettled when the run ended
    bool isolate_tainted{false};           ///< Isolate must not be reused
};

/**
 * @class ProgramRunner
 * @brief Compiles and runs a program in a fresh scope of a leased isolate
 * 
 * Each Run() creates its own scope, installs the capability bridge, runs
 * the program to a terminal state and tears the scope down again. Nothing
 * created by the program survives the call.
 */
class ProgramRunner {
public:
    ProgramRunner(Isolate& isolate, bridge::HostDispatcher& dispatcher, const EngineConfig& config);

    /**
     * @brief Run @p program to a terminal state
     * 
     * @param program Program body (top-level `await` allowed)
     * @param capabilities Project-scoped capability implementation
     * @param output Receives the program's log lines
     * @param deadline Overall completion deadline of the invocation
     * @return Terminal outcome; never COMPILING or RUNNING
     * 
     * @throws std::runtime_error if the scope cannot be set up
     */
    RunOutcome Run(const std::string& program,
                   std::shared_ptr<const capabilities::ScopedCapabilities> capabilities,
                   OutputCollector& output,
                   std::chrono::steady_clock::time_point deadline);

    /**
     * @brief Source actually compiled for a program body
     * 
     * The body becomes an async arrow function. Evaluating the source yields
     * the function; calling it yields the single promise that tracks the
     * program's completion.
     */
    static std::string WrapProgram(const std::string& program);

private:
    Isolate& isolate_;
    bridge::HostDispatcher& dispatcher_;
    const EngineConfig& config_;
};

} // namespace core
} // namespace capsule
