/**
 * @file execution_engine.cpp
 * @brief Implementation of the execution engine
 * 
 * @date 2025
 */

#include "capsule/core/execution_engine.hpp"
#include "capsule/capabilities/scoped_capabilities.hpp"
#include "capsule/core/execute_request.hpp"
#include "capsule/core/output_collector.hpp"
#include "capsule/core/program_runner.hpp"
#include "capsule/core/result_translator.hpp"
#include "capsule/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace capsule {
namespace core {

namespace {

std::shared_ptr<capabilities::CapabilityStore> RequireStore(std::shared_ptr<capabilities::CapabilityStore> store) {
    if (!store) {
        throw std::invalid_argument("ExecutionEngine requires a capability store");
    }
    return store;
}

const EngineConfig& RequireValid(const EngineConfig& config) {
    ValidateEngineConfig(config);
    return config;
}

} // namespace

// Constructor
ExecutionEngine::ExecutionEngine(std::shared_ptr<capabilities::CapabilityStore> store,
                                 const EngineConfig& config)
    : config_(RequireValid(config))
    , store_(RequireStore(std::move(store)))
    , loader_(config_.max_program_bytes)
    , dispatcher_(std::make_unique<bridge::HostDispatcher>(config_.dispatcher_threads))
    , pool_(std::make_unique<IsolatePool>(config_.pool_size, config_.memory_limit_mb, config_.max_stack_kb)) {

    spdlog::info("Execution engine initialized");
    spdlog::debug("Script timeout: {} ms, overall timeout: {} ms",
                  config_.script_timeout.count(), config_.overall_timeout.count());
    spdlog::debug("Memory limit: {} MB, stack: {} KB, pool: {}, host threads: {}",
                  config_.memory_limit_mb, config_.max_stack_kb,
                  config_.pool_size, dispatcher_->WorkerCount());
}

// Destructor
ExecutionEngine::~ExecutionEngine() {
    spdlog::debug("Execution engine destroyed after {} invocation(s)", invocations_.load());
}

std::string ExecutionEngine::TimeoutMessage() const {
    return "Execution timeout after " + std::to_string(config_.overall_timeout.count()) + "ms";
}

ExecutionResult ExecutionEngine::Execute(const std::string& program, const ExecutionContext& context) {
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + config_.overall_timeout;
    const std::uint64_t invocation = next_invocation_++;

    spdlog::info("Invocation #{} started (project {}, {} bytes)",
                 invocation, context.project_id, program.size());

    OutputCollector output(config_.max_output_bytes);
    IsolateLease lease;
    ExecutionResult result;

    try {
        if (context.project_id.empty()) {
            throw RequestError("Missing required fields: code, projectId");
        }
        loader_.Validate(program);
        spdlog::debug("Invocation #{} program {}", invocation,
                      ProgramLoader::Fingerprint(program).substr(0, 12));

        auto capabilities = std::make_shared<const capabilities::ScopedCapabilities>(store_, context);

        lease = pool_->Acquire(deadline);
        spdlog::debug("Invocation #{} leased isolate #{}", invocation, lease->Id());

        ProgramRunner runner(lease.Get(), *dispatcher_, config_);
        RunOutcome outcome = runner.Run(program, std::move(capabilities), output, deadline);
        capability_calls_ += outcome.capability_calls;
        if (outcome.isolate_tainted) {
            lease.Discard();
        }

        result = ResultTranslator::Translate(outcome, output, started);
    }
    catch (const RequestError& e) {
        result = ResultTranslator::Failure(ErrorKind::INVALID_REQUEST, e.what(), output.Text(), started);
    }
    catch (const ProgramValidationError& e) {
        result = ResultTranslator::Failure(ErrorKind::COMPILE, e.what(), output.Text(), started);
    }
    catch (const PoolExhaustedError& e) {
        spdlog::warn("Invocation #{}: {}", invocation, e.what());
        result = ResultTranslator::Failure(ErrorKind::TIMEOUT, TimeoutMessage(), output.Text(), started);
    }
    catch (const std::exception& e) {
        spdlog::error("Invocation #{} failed in the host: {}", invocation, e.what());
        if (lease) {
            lease.Discard();
        }
        result = ResultTranslator::Failure(ErrorKind::INTERNAL, e.what(), output.Text(), started);
    }

    Record(invocation, result);
    return result;
}

std::future<ExecutionResult> ExecutionEngine::ExecuteAsync(
    std::string program,
    ExecutionContext context,
    std::function<void(const ExecutionResult&)> callback) {

    return std::async(std::launch::async,
                      [this, program = std::move(program), context = std::move(context), callback]() {
        auto result = Execute(program, context);

        if (callback) {
            callback(result);
        }

        return result;
    });
}

ExecutionResult ExecutionEngine::HandleRequest(const json& body) {
    ExecuteRequest request;
    try {
        request = ParseExecuteRequest(body);
    }
    catch (const RequestError& e) {
        spdlog::warn("Rejected request: {}", e.what());
        ExecutionResult result = ResultTranslator::Failure(
            ErrorKind::INVALID_REQUEST, e.what(), "", std::chrono::steady_clock::now());
        invocations_++;
        failed_++;
        return result;
    }

    return Execute(request.code, request.context);
}

void ExecutionEngine::Record(std::uint64_t invocation, const ExecutionResult& result) {
    invocations_++;

    if (result.success) {
        succeeded_++;
        spdlog::info("Invocation #{} completed in {} ms", invocation, result.execution_time_ms);
        return;
    }

    switch (result.error_kind) {
        case ErrorKind::TIMEOUT:
            timed_out_++;
            break;
        case ErrorKind::RESOURCE_LIMIT:
            resource_limited_++;
            break;
        default:
            failed_++;
            break;
    }

    spdlog::warn("Invocation #{} {} after {} ms: {}", invocation, ToString(result.error_kind),
                 result.execution_time_ms,
                 utils::StringUtils::Preview(result.error.value_or(""), 200));
}

EngineStats ExecutionEngine::GetStats() const {
    EngineStats stats;
    stats.invocations = invocations_.load();
    stats.succeeded = succeeded_.load();
    stats.failed = failed_.load();
    stats.timed_out = timed_out_.load();
    stats.resource_limited = resource_limited_.load();
    stats.capability_calls = capability_calls_.load();
    stats.dispatcher_queue_depth = dispatcher_->QueueDepth();
    stats.dispatcher_workers = dispatcher_->WorkerCount();
    stats.dispatcher_threads = dispatcher_->ThreadCount();
    stats.pool = pool_->GetStats();
    return stats;
}

} // namespace core
} // namespace capsule
