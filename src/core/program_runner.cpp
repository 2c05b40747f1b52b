/**
 * @file program_runner.cpp
 * @brief Implementation of the program runner and its event loop
 * 
 * @date 2025
 */

#include "capsule/core/program_runner.hpp"
#include "capsule/bridge/capability_bridge.hpp"
#include "capsule/bridge/value_marshal.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace capsule {
namespace core {

namespace {

using Clock = std::chrono::steady_clock;

/**
 * @brief Interrupt handler state for one run
 * 
 * QuickJS polls the handler while executing bytecode. A slice is one
 * uninterrupted stretch of program code (evaluation, a job drain, a
 * settle); it may not outlast the script timeout or the overall deadline.
 */
class InterruptWatchdog {
public:
    enum class Cause { NONE, SLICE, DEADLINE };

    InterruptWatchdog(JSRuntime* runtime, std::chrono::milliseconds slice, Clock::time_point deadline)
        : runtime_(runtime)
        , slice_(slice)
        , deadline_(deadline)
        , slice_deadline_(deadline) {
        JS_SetInterruptHandler(runtime_, &InterruptWatchdog::Handler, this);
    }

    ~InterruptWatchdog() {
        JS_SetInterruptHandler(runtime_, nullptr, nullptr);
    }

    InterruptWatchdog(const InterruptWatchdog&) = delete;
    InterruptWatchdog& operator=(const InterruptWatchdog&) = delete;

    void BeginSlice() {
        slice_deadline_ = std::min(Clock::now() + slice_, deadline_);
    }

    bool Fired() const { return cause_ != Cause::NONE; }
    Cause FiredCause() const { return cause_; }

private:
    JSRuntime* runtime_;
    std::chrono::milliseconds slice_;
    Clock::time_point deadline_;
    Clock::time_point slice_deadline_;
    Cause cause_{Cause::NONE};

    static int Handler(JSRuntime* /*runtime*/, void* opaque) {
        auto* self = static_cast<InterruptWatchdog*>(opaque);
        if (self->cause_ != Cause::NONE) {
            return 1;
        }
        auto now = Clock::now();
        if (now >= self->deadline_) {
            self->cause_ = Cause::DEADLINE;
        }
        else if (now >= self->slice_deadline_) {
            self->cause_ = Cause::SLICE;
        }
        return self->cause_ != Cause::NONE ? 1 : 0;
    }
};

struct ContextDeleter {
    void operator()(JSContext* ctx) const { JS_FreeContext(ctx); }
};

using ScopePtr = std::unique_ptr<JSContext, ContextDeleter>;

/**
 * @brief Fresh scope with language intrinsics only
 * 
 * No std/os modules, no module loader, no timers.
 */
ScopePtr NewScope(JSRuntime* runtime) {
    ScopePtr ctx(JS_NewContextRaw(runtime));
    if (!ctx) {
        throw std::runtime_error("Failed to create execution scope");
    }
    JS_AddIntrinsicBaseObjects(ctx.get());
    JS_AddIntrinsicDate(ctx.get());
    JS_AddIntrinsicEval(ctx.get());
    JS_AddIntrinsicStringNormalize(ctx.get());
    JS_AddIntrinsicRegExp(ctx.get());
    JS_AddIntrinsicJSON(ctx.get());
    JS_AddIntrinsicProxy(ctx.get());
    JS_AddIntrinsicMapSet(ctx.get());
    JS_AddIntrinsicTypedArrays(ctx.get());
    JS_AddIntrinsicPromise(ctx.get());
    return ctx;
}

/**
 * @brief True when a failure is the runtime refusing memory at its limit
 * 
 * The allocator hook must have refused an allocation during this run and
 * the error must be the engine's own out-of-memory error. A program that
 * throws a message of its own keeps that message.
 */
bool IsOutOfMemory(const Isolate& isolate, const std::string& message) {
    return isolate.MemoryLimitHit() &&
           (message == "out of memory" || message == "InternalError: out of memory");
}

/**
 * @brief Start the compiled program function
 * 
 * A body with an unbalanced `}` can close the wrapper early, in which case
 * the evaluated value is not the wrapper function or its call does not
 * return a promise. Both are reported as a SyntaxError.
 * 
 * @return Program promise, or JS_EXCEPTION with the exception pending
 */
JSValue StartProgram(JSContext* ctx, JSValue function) {
    if (!JS_IsFunction(ctx, function)) {
        JS_FreeValue(ctx, function);
        return JS_ThrowSyntaxError(ctx, "unexpected '}' closes the program body");
    }
    JSValue promise = JS_Call(ctx, function, JS_UNDEFINED, 0, nullptr);
    JS_FreeValue(ctx, function);
    if (JS_IsException(promise)) {
        return promise;
    }
    if (static_cast<int>(JS_PromiseState(ctx, promise)) < 0) {
        JS_FreeValue(ctx, promise);
        return JS_ThrowSyntaxError(ctx, "unexpected '}' closes the program body");
    }
    return promise;
}

} // namespace

ProgramRunner::ProgramRunner(Isolate& isolate, bridge::HostDispatcher& dispatcher, const EngineConfig& config)
    : isolate_(isolate)
    , dispatcher_(dispatcher)
    , config_(config) {
}

std::string ProgramRunner::WrapProgram(const std::string& program) {
    return "(async () => {\n" + program + "\n})";
}

RunOutcome ProgramRunner::Run(const std::string& program,
                              std::shared_ptr<const capabilities::ScopedCapabilities> capabilities,
                              OutputCollector& output,
                              Clock::time_point deadline) {
    JSRuntime* runtime = isolate_.Runtime();
    JS_UpdateStackTop(runtime);
    isolate_.MarkUsed();
    isolate_.ClearMemoryLimitHit();

    RunOutcome outcome;

    auto fail = [&outcome](RunState state, ErrorKind kind, std::string message) {
        outcome.state = state;
        outcome.error_kind = kind;
        outcome.error = std::move(message);
    };

    // Classify an error raised while program code was running
    auto fail_with = [&](const InterruptWatchdog& watchdog, const std::string& message, ErrorKind kind) {
        if (watchdog.Fired()) {
            auto budget = watchdog.FiredCause() == InterruptWatchdog::Cause::SLICE
                              ? config_.script_timeout
                              : config_.overall_timeout;
            fail(RunState::TIMED_OUT, ErrorKind::TIMEOUT,
                 "Execution timeout after " + std::to_string(budget.count()) + "ms");
        }
        else if (IsOutOfMemory(isolate_, message)) {
            fail(RunState::FAILED, ErrorKind::RESOURCE_LIMIT,
                 "Execution exceeded memory limit of " + std::to_string(config_.memory_limit_mb) + " MB");
            outcome.isolate_tainted = true;
        }
        else {
            fail(RunState::FAILED, kind, message);
        }
    };

    {
        InterruptWatchdog watchdog(runtime, config_.script_timeout, deadline);
        ScopePtr scope = NewScope(runtime);
        JSContext* ctx = scope.get();
        bridge::CapabilityBridge bridge(ctx, std::move(capabilities), dispatcher_, output);
        bridge.Install();

        // COMPILING
        std::string source = WrapProgram(program);
        watchdog.BeginSlice();
        JSValue function = JS_Eval(ctx, source.c_str(), source.size(), "<program>", JS_EVAL_TYPE_GLOBAL);
        JSValue promise = JS_IsException(function) ? function : StartProgram(ctx, function);
        if (JS_IsException(promise)) {
            fail_with(watchdog, bridge::TakeException(ctx, true), ErrorKind::COMPILE);
        }
        else {
            // RUNNING
            outcome.state = RunState::RUNNING;
            spdlog::debug("Program compiled ({} bytes), running", program.size());
            bridge.WatchProgram(promise);

            while (outcome.state == RunState::RUNNING) {
                watchdog.BeginSlice();
                JSContext* job_ctx = nullptr;
                int job = 0;
                while ((job = JS_ExecutePendingJob(runtime, &job_ctx)) > 0) {
                }
                if (job < 0) {
                    fail_with(watchdog, bridge::TakeException(job_ctx, false), ErrorKind::RUNTIME);
                    break;
                }
                if (watchdog.Fired()) {
                    fail_with(watchdog, "", ErrorKind::TIMEOUT);
                    break;
                }

                std::string error;
                auto state = bridge.PollProgram(error);
                if (state == bridge::ProgramState::FULFILLED) {
                    outcome.state = RunState::COMPLETED;
                    break;
                }
                if (state == bridge::ProgramState::REJECTED) {
                    fail_with(watchdog, error, ErrorKind::RUNTIME);
                    break;
                }

                if (Clock::now() >= deadline) {
                    fail(RunState::TIMED_OUT, ErrorKind::TIMEOUT,
                         "Execution timeout after " + std::to_string(config_.overall_timeout.count()) + "ms");
                    break;
                }

                auto completions = bridge.Channel()->WaitUntil(deadline);
                if (completions.empty()) {
                    continue;
                }

                watchdog.BeginSlice();
                if (!bridge.Settle(completions)) {
                    fail_with(watchdog, bridge::TakeException(ctx, false), ErrorKind::RUNTIME);
                }
            }
        }

        outcome.capability_calls = bridge.StartedCalls();
        outcome.abandoned_calls = bridge.PendingCalls();
        // Only an exhausted budget cancels calls the program already issued
        bridge.Abandon(outcome.state == RunState::TIMED_OUT);
    }

    JS_RunGC(runtime);
    if (isolate_.HasPendingJobs()) {
        outcome.isolate_tainted = true;
    }

    spdlog::debug("Run finished: {} ({} capability call(s), {} abandoned, {} heap bytes after GC)",
                  ToString(outcome.state), outcome.capability_calls, outcome.abandoned_calls,
                  isolate_.MemoryUsed());
    return outcome;
}

} // namespace core
} // namespace capsule
