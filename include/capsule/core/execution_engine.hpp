/**
 * @file execution_engine.hpp
 * @brief Sandboxed execution of AI-authored programs against a scoped capability API
 * 
 * The engine takes untrusted program text plus an ExecutionContext, runs
 * the program in a fresh scope of an isolated environment whose only
 * reach into the host is the project-scoped capability API, and always
 * answers with an ExecutionResult.
 * 
 * @date 2025
 */

#pragma once

#include "capsule/bridge/host_dispatcher.hpp"
#include "capsule/capabilities/capability_store.hpp"
#include "capsule/core/engine_config.hpp"
#include "capsule/core/execution_types.hpp"
#include "capsule/core/isolate_pool.hpp"
#include "capsule/core/program_loader.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace capsule {
namespace core {

/**
 * @struct EngineStats
 * @brief Engine-wide counters
 */
struct EngineStats {
    std::uint64_t invocations{0};        ///< Invocations finished
    std::uint64_t succeeded{0};          ///< success == true
    std::uint64_t failed{0};             ///< Compile, runtime and internal failures
    std::uint64_t timed_out{0};          ///< Script or overall timeout
    std::uint64_t resource_limited{0};   ///< Memory limit hit
    std::uint64_t capability_calls{0};   ///< Calls started by programs
    std::size_t dispatcher_queue_depth{0};  ///< Calls waiting for a host thread
    std::size_t dispatcher_workers{0};      ///< Host threads serving the queue
    std::size_t dispatcher_threads{0};      ///< Host threads alive, incl. ones held by abandoned calls
    IsolatePoolStats pool;               ///< Isolate pool counters
};

/**
 * @class ExecutionEngine
 * @brief Entry point for running programs
 * 
 * Owns the isolate pool and the host dispatcher. Invocations are
 * independent: each gets its own scope, its own capability instance bound
 * to its own context, its own output and its own completion channel.
 * 
 * **Error Handling**: Execute() reports every failure inside the returned
 * ExecutionResult; nothing is thrown across this boundary.
 * 
 * **Thread Safety**: thread-safe. Up to @c pool_size invocations run in
 * parallel; further callers wait for an isolate within their own deadline.
 * 
 * **Usage Example**:
 * @code
 * auto store = capabilities::MemoryStore::LoadFromFile("fixtures.json");
 * ExecutionEngine engine(store, EngineBuilder().WithOverallTimeout(std::chrono::seconds(10))
 *                                              .WithScriptTimeout(std::chrono::seconds(5))
 *                                              .Build());
 * 
 * ExecutionContext context{"P", std::nullopt, std::string("u-1")};
 * auto result = engine.Execute(
 *     "const s = await stories.findActive(); log(`Found ${s.length}`);", context);
 * 
 * std::cout << ResultTranslator::ToJsonString(result) << std::endl;
 * @endcode
 */
class ExecutionEngine {
public:
    /**
     * @param store Backing store shared by all invocations
     * @param config Engine configuration
     * 
     * @throws std::invalid_argument if @p store is null or @p config is invalid
     */
    explicit ExecutionEngine(std::shared_ptr<capabilities::CapabilityStore> store,
                             const EngineConfig& config = EngineConfig{});

    ~ExecutionEngine();

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    /**
     * @brief Run one program to a terminal state
     * 
     * @param program Program body; top-level `await` is allowed
     * @param context Identifiers the capabilities are scoped to
     * @return Normalized result; `executionTimeMs` is measured from entry
     */
    ExecutionResult Execute(const std::string& program, const ExecutionContext& context);

    /**
     * @brief Run one program on a background thread
     * 
     * @param callback Invoked with the result before the future becomes ready
     * @note The engine must outlive the returned future.
     */
    std::future<ExecutionResult> ExecuteAsync(
        std::string program,
        ExecutionContext context,
        std::function<void(const ExecutionResult&)> callback = nullptr
    );

    /**
     * @brief Run the program described by a request envelope
     * 
     * A malformed envelope yields a failed result with
     * "Missing required fields: code, projectId".
     */
    ExecutionResult HandleRequest(const nlohmann::json& body);

    const EngineConfig& GetConfig() const { return config_; }

    EngineStats GetStats() const;

private:
    EngineConfig config_;
    std::shared_ptr<capabilities::CapabilityStore> store_;
    ProgramLoader loader_;
    std::unique_ptr<bridge::HostDispatcher> dispatcher_;
    std::unique_ptr<IsolatePool> pool_;

    std::atomic<std::uint64_t> next_invocation_{1};
    std::atomic<std::uint64_t> invocations_{0};
    std::atomic<std::uint64_t> succeeded_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::atomic<std::uint64_t> timed_out_{0};
    std::atomic<std::uint64_t> resource_limited_{0};
    std::atomic<std::uint64_t> capability_calls_{0};

    void Record(std::uint64_t invocation, const ExecutionResult& result);
    std::string TimeoutMessage() const;
};

/**
 * @class EngineBuilder
 * @brief Fluent API for constructing engine configurations
 * 
 * **Usage Example**:
 * @code
 * auto config = EngineBuilder()
 *     .WithScriptTimeout(std::chrono::milliseconds(2000))
 *     .WithOverallTimeout(std::chrono::milliseconds(5000))
 *     .WithMemoryLimit(64)
 *     .WithPoolSize(2)
 *     .Build();
 * @endcode
 */
class EngineBuilder {
public:
    EngineBuilder() = default;

    /// Start from an existing configuration (e.g. one loaded from JSON)
    explicit EngineBuilder(const EngineConfig& base) : config_(base) {}

    EngineBuilder& WithScriptTimeout(std::chrono::milliseconds timeout) {
        config_.script_timeout = timeout;
        return *this;
    }

    EngineBuilder& WithOverallTimeout(std::chrono::milliseconds timeout) {
        config_.overall_timeout = timeout;
        return *this;
    }

    /**
     * @brief Set the heap limit of each isolate
     * @param mb Memory limit in megabytes
     */
    EngineBuilder& WithMemoryLimit(std::size_t mb) {
        config_.memory_limit_mb = mb;
        return *this;
    }

    EngineBuilder& WithMaxStack(std::size_t kb) {
        config_.max_stack_kb = kb;
        return *this;
    }

    EngineBuilder& WithPoolSize(std::size_t isolates) {
        config_.pool_size = isolates;
        return *this;
    }

    EngineBuilder& WithDispatcherThreads(std::size_t threads) {
        config_.dispatcher_threads = threads;
        return *this;
    }

    EngineBuilder& WithMaxProgramBytes(std::size_t bytes) {
        config_.max_program_bytes = bytes;
        return *this;
    }

    EngineBuilder& WithMaxOutputBytes(std::size_t bytes) {
        config_.max_output_bytes = bytes;
        return *this;
    }

    EngineBuilder& EnableVerboseLogging(bool enable = true) {
        config_.verbose_logging = enable;
        return *this;
    }

    /**
     * @brief Build configuration
     * @return Validated EngineConfig
     * @throws std::invalid_argument if the configuration is invalid
     */
    EngineConfig Build() const {
        ValidateEngineConfig(config_);
        return config_;
    }

private:
    EngineConfig config_;
};

} // namespace core
} // namespace capsule
