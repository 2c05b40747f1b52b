/**
 * @file capability.hpp
 * @brief Closed vocabulary of operations a sandboxed program may invoke
 * 
 * The descriptor table below is the single source of truth for the
 * capability surface: the bridge builds the scope's bindings from it and
 * nothing else, so an operation that is not listed here is unreachable.
 * 
 * **Surface installed in every scope**:
 * ```
 * stories.findActive()            stories.find()          (alias)
 * stories.findAll()
 * stories.findByKey(key)
 * stories.update(id, changes)
 * meetings.get(id?)
 * risks.create(data)
 * storyUpdates.create(data)       storyUpdates.append(data)  (alias)
 * ```
 * 
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace capsule {
namespace capabilities {

/**
 * @enum CapabilityOperation
 * @brief Host-side operations behind the capability surface
 */
enum class CapabilityOperation {
    STORIES_FIND_ACTIVE,   ///< Stories of the project not yet done
    STORIES_FIND_ALL,      ///< Every story of the project
    STORIES_FIND_BY_KEY,   ///< One story by natural key, or null
    STORIES_UPDATE,        ///< Partial update of allow-listed fields
    MEETINGS_GET,          ///< One meeting of the project, or null
    RISKS_CREATE,          ///< Create a risk/blocker with defaults
    STORY_UPDATES_APPEND   ///< Append a field-level change record
};

/**
 * @struct CapabilityDescriptor
 * @brief One binding of the sandbox-visible surface
 */
struct CapabilityDescriptor {
    const char* object_name;         ///< Global object the method hangs off
    const char* method_name;         ///< Method name visible to the program
    CapabilityOperation operation;   ///< Host operation it dispatches to
    int arity;                       ///< Declared `length` of the JS function
};

/**
 * @class CapabilityError
 * @brief Host-side failure of a single capability call
 * 
 * Surfaced to the program as a rejected promise; never escapes the engine.
 */
class CapabilityError : public std::runtime_error {
public:
    explicit CapabilityError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Fixed descriptor table, in installation order
 */
const std::vector<CapabilityDescriptor>& CapabilityTable();

/**
 * @brief Canonical dotted name of an operation (e.g. "stories.update")
 */
const char* OperationName(CapabilityOperation operation);

} // namespace capabilities
} // namespace capsule
