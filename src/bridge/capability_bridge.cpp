/**
 * @file capability_bridge.cpp
 * @brief Implementation of the sandbox/host capability bridge
 * 
 * @date 2025
 */

#include "capsule/bridge/capability_bridge.hpp"
#include "capsule/bridge/value_marshal.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <initializer_list>
#include <map>
#include <optional>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace capsule {
namespace bridge {

using capabilities::CapabilityDescriptor;
using capabilities::CapabilityTable;
using capabilities::OperationName;

namespace {

constexpr int READ_ONLY = JS_PROP_ENUMERABLE;

JSValue NewOptionalString(JSContext* ctx, const std::optional<std::string>& value) {
    return value ? JS_NewStringLen(ctx, value->data(), value->size()) : JS_NULL;
}

} // namespace

// Constructor
CapabilityBridge::CapabilityBridge(JSContext* ctx,
                                   std::shared_ptr<const capabilities::ScopedCapabilities> capabilities,
                                   HostDispatcher& dispatcher,
                                   core::OutputCollector& output)
    : ctx_(ctx)
    , capabilities_(std::move(capabilities))
    , dispatcher_(dispatcher)
    , output_(output)
    , channel_(std::make_shared<CompletionChannel>())
    , group_(dispatcher.OpenGroup())
    , program_(JS_UNDEFINED) {
    if (!ctx_ || !capabilities_) {
        throw std::invalid_argument("CapabilityBridge requires a scope and capabilities");
    }
    JS_SetContextOpaque(ctx_, this);
}

// Destructor
CapabilityBridge::~CapabilityBridge() {
    Abandon(false);
    JS_SetContextOpaque(ctx_, nullptr);
}

void CapabilityBridge::DefineGlobal(JSValueConst global, const char* name, JSValue value) {
    if (JS_DefinePropertyValueStr(ctx_, global, name, value, READ_ONLY) < 0) {
        throw std::runtime_error(std::string("Failed to define sandbox binding '") + name +
                                 "': " + TakeException(ctx_, true));
    }
}

void CapabilityBridge::Install() {
    JSValue global = JS_GetGlobalObject(ctx_);

    try {
        const auto& context = capabilities_->Context();
        DefineGlobal(global, "projectId",
                     JS_NewStringLen(ctx_, context.project_id.data(), context.project_id.size()));
        DefineGlobal(global, "meetingId", NewOptionalString(ctx_, context.meeting_id));
        DefineGlobal(global, "userId", NewOptionalString(ctx_, context.user_id));

        // Capability objects, one per distinct object name in the table
        std::map<std::string, JSValue> objects;
        const auto& table = CapabilityTable();
        for (std::size_t i = 0; i < table.size(); ++i) {
            const CapabilityDescriptor& descriptor = table[i];
            auto it = objects.find(descriptor.object_name);
            if (it == objects.end()) {
                it = objects.emplace(descriptor.object_name, JS_NewObject(ctx_)).first;
            }
            JSValue fn = JS_NewCFunctionMagic(ctx_, &CapabilityBridge::CallCapability,
                                              descriptor.method_name, descriptor.arity,
                                              JS_CFUNC_generic_magic, static_cast<int>(i));
            if (JS_DefinePropertyValueStr(ctx_, it->second, descriptor.method_name, fn, READ_ONLY) < 0) {
                for (auto& entry : objects) {
                    JS_FreeValue(ctx_, entry.second);
                }
                throw std::runtime_error(std::string("Failed to define capability ") +
                                         descriptor.object_name + "." + descriptor.method_name);
            }
        }
        for (auto& entry : objects) {
            JS_PreventExtensions(ctx_, entry.second);
            DefineGlobal(global, entry.first.c_str(), entry.second);
        }

        DefineGlobal(global, "log", JS_NewCFunction(ctx_, &CapabilityBridge::CallLog, "log", 1));

        // Every console level writes the same plain line as log()
        JSValue console = JS_NewObject(ctx_);
        for (const char* method : {"log", "info", "warn", "error"}) {
            JS_DefinePropertyValueStr(ctx_, console, method,
                                      JS_NewCFunction(ctx_, &CapabilityBridge::CallLog, method, 1),
                                      READ_ONLY);
        }
        JS_PreventExtensions(ctx_, console);
        DefineGlobal(global, "console", console);
    }
    catch (...) {
        JS_FreeValue(ctx_, global);
        throw;
    }

    JS_FreeValue(ctx_, global);
    spdlog::debug("Installed {} capability bindings for project {}",
                  CapabilityTable().size(), capabilities_->Context().project_id);
}

JSValue CapabilityBridge::CallCapability(JSContext* ctx, JSValueConst /*this_val*/,
                                         int argc, JSValueConst* argv, int magic) {
    auto* bridge = static_cast<CapabilityBridge*>(JS_GetContextOpaque(ctx));
    const auto& table = CapabilityTable();
    if (!bridge || magic < 0 || static_cast<std::size_t>(magic) >= table.size()) {
        return JS_ThrowInternalError(ctx, "capability is no longer available");
    }
    return bridge->StartCall(table[static_cast<std::size_t>(magic)], argc, argv);
}

JSValue CapabilityBridge::CallLog(JSContext* ctx, JSValueConst /*this_val*/,
                                  int argc, JSValueConst* argv) {
    auto* bridge = static_cast<CapabilityBridge*>(JS_GetContextOpaque(ctx));
    if (bridge) {
        bridge->EmitLog(argc, argv);
    }
    return JS_UNDEFINED;
}

JSValue CapabilityBridge::StartCall(const CapabilityDescriptor& descriptor,
                                    int argc, JSValueConst* argv) {
    const char* name = OperationName(descriptor.operation);

    json args;
    try {
        args = MarshalArguments(ctx_, argc, argv);
    }
    catch (const MarshalError& e) {
        return JS_ThrowTypeError(ctx_, "%s: %s", name, e.what());
    }

    JSValue resolving[2];
    JSValue promise = JS_NewPromiseCapability(ctx_, resolving);
    if (JS_IsException(promise)) {
        return promise;
    }

    std::uint64_t call_id = next_call_id_++;
    pending_.emplace(call_id, PendingCall{resolving[0], resolving[1], descriptor.operation});
    spdlog::debug("Call #{} {} {}", call_id, name, args.dump());

    auto channel = channel_;
    auto capabilities = capabilities_;
    auto operation = descriptor.operation;
    try {
        dispatcher_.Submit(group_, [channel, capabilities, operation, call_id, args]() {
            if (channel->IsCancelled()) {
                spdlog::debug("Skipping call #{} {}: invocation already ended",
                              call_id, OperationName(operation));
                return;
            }

            CallCompletion completion;
            completion.call_id = call_id;
            try {
                json result = capabilities->Invoke(operation, args);
                completion.payload = result.dump(-1, ' ', false, json::error_handler_t::replace);
                completion.ok = true;
            }
            catch (const std::exception& e) {
                completion.payload = e.what();
                completion.ok = false;
            }
            channel->Post(std::move(completion));
        });
    }
    catch (const std::exception& e) {
        auto it = pending_.find(call_id);
        JS_FreeValue(ctx_, it->second.resolve);
        JS_FreeValue(ctx_, it->second.reject);
        pending_.erase(it);
        JS_FreeValue(ctx_, promise);
        return JS_ThrowInternalError(ctx_, "%s: %s", name, e.what());
    }

    return promise;
}

void CapabilityBridge::EmitLog(int argc, JSValueConst* argv) {
    std::string line;
    for (int i = 0; i < argc; ++i) {
        if (i > 0) {
            line += ' ';
        }
        line += ToStdString(ctx_, argv[i]);
    }

    spdlog::trace("program: {}", line);
    output_.AppendLine(std::move(line));
}

void CapabilityBridge::WatchProgram(JSValue promise) {
    JS_FreeValue(ctx_, program_);
    program_ = promise;
}

ProgramState CapabilityBridge::PollProgram(std::string& error) {
    switch (JS_PromiseState(ctx_, program_)) {
        case JS_PROMISE_PENDING:
            return ProgramState::PENDING;
        case JS_PROMISE_FULFILLED:
            return ProgramState::FULFILLED;
        case JS_PROMISE_REJECTED: {
            JSValue reason = JS_PromiseResult(ctx_, program_);
            error = DescribeError(ctx_, reason, false);
            JS_FreeValue(ctx_, reason);
            return ProgramState::REJECTED;
        }
    }
    throw std::logic_error("Watched program value is not a promise");
}

bool CapabilityBridge::Settle(const std::vector<CallCompletion>& completions) {
    bool clean = true;

    for (const auto& completion : completions) {
        auto it = pending_.find(completion.call_id);
        if (it == pending_.end()) {
            spdlog::debug("Ignoring completion of unknown call #{}", completion.call_id);
            continue;
        }
        PendingCall call = it->second;
        pending_.erase(it);

        bool reject = !completion.ok;
        JSValue argument;
        if (completion.ok) {
            argument = ParseJsonText(ctx_, completion.payload);
            if (JS_IsException(argument)) {
                argument = JS_GetException(ctx_);
                reject = true;
            }
        }
        else {
            spdlog::debug("Call #{} {} failed: {}", completion.call_id,
                          OperationName(call.operation), completion.payload);
            argument = JS_NewError(ctx_);
            JS_DefinePropertyValueStr(ctx_, argument, "message",
                                      JS_NewStringLen(ctx_, completion.payload.data(),
                                                      completion.payload.size()),
                                      JS_PROP_WRITABLE | JS_PROP_CONFIGURABLE);
        }

        JSValue ret = JS_Call(ctx_, reject ? call.reject : call.resolve, JS_UNDEFINED, 1, &argument);
        if (JS_IsException(ret)) {
            clean = false;
        }
        JS_FreeValue(ctx_, ret);
        JS_FreeValue(ctx_, argument);
        JS_FreeValue(ctx_, call.resolve);
        JS_FreeValue(ctx_, call.reject);

        if (!clean) {
            break;
        }
    }

    return clean;
}

void CapabilityBridge::Abandon(bool cancel_queued) {
    if (cancel_queued) {
        channel_->Cancel();
    }
    else {
        channel_->Close();
    }
    dispatcher_.ReleaseGroup(group_);

    if (!pending_.empty()) {
        spdlog::debug("Abandoning {} unsettled capability call(s)", pending_.size());
    }
    for (auto& entry : pending_) {
        JS_FreeValue(ctx_, entry.second.resolve);
        JS_FreeValue(ctx_, entry.second.reject);
    }
    pending_.clear();

    JS_FreeValue(ctx_, program_);
    program_ = JS_UNDEFINED;
}

} // namespace bridge
} // namespace capsule
