/**
 * @file scoped_capabilities.hpp
 * @brief Capability implementations bound to one ExecutionContext
 * 
 * The statically-typed host side of the capability surface. An instance is
 * created per invocation, captures the context by value and forwards every
 * operation to the store with the context's project scope. Identifiers a
 * program passes for the project are ignored; only row identifiers (story
 * ids, story keys, meeting ids) come from the program.
 * 
 * Arguments arrive as the JSON array the bridge unmarshaled from the
 * sandbox; results leave as JSON for the bridge to marshal back.
 * 
 * @date 2025
 */

#pragma once

#include "capsule/capabilities/capability.hpp"
#include "capsule/capabilities/capability_store.hpp"
#include "capsule/core/execution_types.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace capsule {
namespace capabilities {

/**
 * @class ScopedCapabilities
 * @brief Context-bound capability operations
 * 
 * Immutable after construction and safe to call from several dispatcher
 * threads at once.
 * 
 * **Usage Example**:
 * @code
 * core::ExecutionContext context{"p-1", std::string("m-7"), std::nullopt};
 * ScopedCapabilities caps(store, context);
 * 
 * auto active = caps.FindActiveStories();                    // p-1 only
 * auto risk = caps.CreateRisk({{"title", "VPN"}, {"description", "No access"}});
 * // risk["project_id"] == "p-1", risk["source_reference"] == "m-7"
 * @endcode
 */
class ScopedCapabilities {
public:
    /**
     * @throws std::invalid_argument if @p store is null or the context has
     *         no project id
     */
    ScopedCapabilities(std::shared_ptr<CapabilityStore> store, core::ExecutionContext context);

    /**
     * @brief Dispatch one operation with unmarshaled arguments
     * 
     * @param operation Operation from the descriptor table
     * @param args JSON array of positional arguments
     * @return JSON result to marshal back into the sandbox
     * @throws CapabilityError on invalid arguments or store failure
     */
    nlohmann::json Invoke(CapabilityOperation operation, const nlohmann::json& args) const;

    nlohmann::json FindActiveStories() const;
    nlohmann::json FindAllStories() const;

    /// Story row, or JSON null when the key is unknown in this project
    nlohmann::json FindStoryByKey(const std::string& story_key) const;

    /**
     * @brief Partial update of `status`, `assigned_to` (or `assignee`) and `notes`
     * 
     * Other fields in @p changes are ignored. Null values leave the field
     * unchanged; non-string notes are stored as their JSON text.
     */
    nlohmann::json UpdateStory(const std::string& story_id, const nlohmann::json& changes) const;

    /// Meeting row, or JSON null; defaults to the context's meeting
    nlohmann::json GetMeeting(const std::optional<std::string>& meeting_id) const;

    /**
     * @brief Create a risk/blocker
     * 
     * Accepts camelCase or snake_case keys. Defaults: risk type "blocker",
     * severity "high", status "open", no stakeholders, no meeting needed,
     * source reference = context meeting, creator = context user.
     */
    nlohmann::json CreateRisk(const nlohmann::json& data) const;

    /**
     * @brief Append a field-level change record for a story of the project
     * 
     * Requires `storyId` and `fieldChanged`; old and new values that are
     * not strings are stored as JSON text.
     */
    nlohmann::json AppendStoryUpdate(const nlohmann::json& data) const;

    const core::ExecutionContext& Context() const { return context_; }

private:
    std::shared_ptr<CapabilityStore> store_;
    const core::ExecutionContext context_;

    std::string Actor() const;
};

} // namespace capabilities
} // namespace capsule
