/**
 * @file capability_bridge.hpp
 * @brief Installs the capability API into a sandbox scope and brokers calls
 * 
 * The bridge is the only place where sandbox code and host code meet. It
 * exposes the descriptor table as native functions that return promises,
 * hands the actual work to the HostDispatcher and later settles each
 * promise from the invocation's CompletionChannel on the runner thread.
 * 
 * @date 2025
 */

#pragma once

#include "capsule/bridge/completion_channel.hpp"
#include "capsule/bridge/host_dispatcher.hpp"
#include "capsule/capabilities/capability.hpp"
#include "capsule/capabilities/scoped_capabilities.hpp"
#include "capsule/core/output_collector.hpp"

extern "C" {
#include <quickjs.h>
}

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace capsule {
namespace bridge {

/**
 * @enum ProgramState
 * @brief Observed state of the wrapped program's promise
 */
enum class ProgramState {
    PENDING,     ///< Still awaiting something
    FULFILLED,   ///< Program body returned
    REJECTED     ///< Program body threw
};

/**
 * @class CapabilityBridge
 * @brief Per-invocation binding between one scope and the host
 * 
 * **Lifecycle**:
 * ```
 * construct -> Install() -> WatchProgram() -> (Settle() / PollProgram())* -> Abandon(cancel)
 * ```
 * 
 * **Thread Safety**: every method must be called on the runner thread that
 * owns the scope. Only the channel is touched by dispatcher threads.
 */
class CapabilityBridge {
public:
    /**
     * @param ctx Scope to install into (not owned, must outlive the bridge)
     * @param capabilities Project-scoped capability implementation
     * @param dispatcher Host worker pool
     * @param output Destination of `log` emissions
     */
    CapabilityBridge(JSContext* ctx,
                     std::shared_ptr<const capabilities::ScopedCapabilities> capabilities,
                     HostDispatcher& dispatcher,
                     core::OutputCollector& output);

    ~CapabilityBridge();

    CapabilityBridge(const CapabilityBridge&) = delete;
    CapabilityBridge& operator=(const CapabilityBridge&) = delete;

    /**
     * @brief Define context constants, capability objects, `log` and `console`
     * 
     * All bindings are read-only and the capability objects are not
     * extensible.
     * 
     * @throws std::runtime_error if a binding cannot be defined
     */
    void Install();

    /**
     * @brief Track the program's promise (takes ownership of @p promise)
     */
    void WatchProgram(JSValue promise);

    /**
     * @brief Observe the program promise
     * @param[out] error Thrown value's message when REJECTED
     */
    ProgramState PollProgram(std::string& error);

    /**
     * @brief Resolve or reject the promises of finished calls
     * 
     * Completions of unknown call ids are ignored.
     * 
     * @return false if settling raised an exception now pending in the context
     */
    bool Settle(const std::vector<CallCompletion>& completions);

    /// Calls whose promises are still unsettled
    std::size_t PendingCalls() const { return pending_.size(); }

    /// Calls started since construction
    std::uint64_t StartedCalls() const { return next_call_id_ - 1; }

    const std::shared_ptr<CompletionChannel>& Channel() const { return channel_; }

    /**
     * @brief End the invocation's host side
     * 
     * Closes the channel so late results are discarded, releases the
     * invocation's dispatcher group and every retained sandbox value.
     * Idempotent.
     * 
     * @param cancel_queued Calls not yet started skip the store (timeouts);
     *        otherwise they still run, unobserved
     */
    void Abandon(bool cancel_queued);

private:
    struct PendingCall {
        JSValue resolve;
        JSValue reject;
        capabilities::CapabilityOperation operation;
    };

    JSContext* ctx_;
    std::shared_ptr<const capabilities::ScopedCapabilities> capabilities_;
    HostDispatcher& dispatcher_;
    core::OutputCollector& output_;
    std::shared_ptr<CompletionChannel> channel_;
    std::uint64_t group_;

    std::unordered_map<std::uint64_t, PendingCall> pending_;
    std::uint64_t next_call_id_{1};
    JSValue program_;

    JSValue StartCall(const capabilities::CapabilityDescriptor& descriptor,
                      int argc, JSValueConst* argv);
    void EmitLog(int argc, JSValueConst* argv);
    void DefineGlobal(JSValueConst global, const char* name, JSValue value);

    static JSValue CallCapability(JSContext* ctx, JSValueConst this_val,
                                  int argc, JSValueConst* argv, int magic);
    static JSValue CallLog(JSContext* ctx, JSValueConst this_val,
                           int argc, JSValueConst* argv);
};

} // namespace bridge
} // namespace capsule
