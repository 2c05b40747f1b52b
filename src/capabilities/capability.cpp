/**
 * @file capability.cpp
 * @brief Capability descriptor table
 * 
 * @date 2025
 */

#include "capsule/capabilities/capability.hpp"

namespace capsule {
namespace capabilities {

const std::vector<CapabilityDescriptor>& CapabilityTable() {
    static const std::vector<CapabilityDescriptor> table = {
        {"stories",      "findActive", CapabilityOperation::STORIES_FIND_ACTIVE,  0},
        {"stories",      "find",       CapabilityOperation::STORIES_FIND_ACTIVE,  0},
        {"stories",      "findAll",    CapabilityOperation::STORIES_FIND_ALL,     0},
        {"stories",      "findByKey",  CapabilityOperation::STORIES_FIND_BY_KEY,  1},
        {"stories",      "update",     CapabilityOperation::STORIES_UPDATE,       2},
        {"meetings",     "get",        CapabilityOperation::MEETINGS_GET,         1},
        {"risks",        "create",     CapabilityOperation::RISKS_CREATE,         1},
        {"storyUpdates", "create",     CapabilityOperation::STORY_UPDATES_APPEND, 1},
        {"storyUpdates", "append",     CapabilityOperation::STORY_UPDATES_APPEND, 1},
    };
    return table;
}

const char* OperationName(CapabilityOperation operation) {
    switch (operation) {
        case CapabilityOperation::STORIES_FIND_ACTIVE:  return "stories.findActive";
        case CapabilityOperation::STORIES_FIND_ALL:     return "stories.findAll";
        case CapabilityOperation::STORIES_FIND_BY_KEY:  return "stories.findByKey";
        case CapabilityOperation::STORIES_UPDATE:       return "stories.update";
        case CapabilityOperation::MEETINGS_GET:         return "meetings.get";
        case CapabilityOperation::RISKS_CREATE:         return "risks.create";
        case CapabilityOperation::STORY_UPDATES_APPEND: return "storyUpdates.create";
    }
    return "unknown";
}

} // namespace capabilities
} // namespace capsule
