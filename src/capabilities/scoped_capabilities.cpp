/**
 * @file scoped_capabilities.cpp
 * @brief Argument handling and context scoping for capability operations
 * 
 * @date 2025
 */

#include "capsule/capabilities/scoped_capabilities.hpp"

#include <spdlog/spdlog.h>

#include <initializer_list>

using json = nlohmann::json;

namespace capsule {
namespace capabilities {

namespace {

const json& Argument(const json& args, std::size_t index) {
    static const json null_value;
    if (!args.is_array() || index >= args.size()) {
        return null_value;
    }
    return args[index];
}

std::string RequireString(const json& value, const char* operation, const char* name) {
    if (!value.is_string() || value.get<std::string>().empty()) {
        throw CapabilityError(std::string(operation) + ": '" + name + "' must be a non-empty string");
    }
    return value.get<std::string>();
}

// First present, non-null member among the given spellings
const json* Member(const json& object, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = object.find(key);
        if (it != object.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

// Strings verbatim, null as unset, everything else as JSON text
std::optional<std::string> AsText(const json* value) {
    if (!value) {
        return std::nullopt;
    }
    if (value->is_string()) {
        return value->get<std::string>();
    }
    return value->dump();
}

std::string StringMember(const json& object, std::initializer_list<const char*> keys,
                         const char* operation, const std::string& fallback) {
    const json* value = Member(object, keys);
    if (!value) {
        return fallback;
    }
    if (!value->is_string()) {
        throw CapabilityError(std::string(operation) + ": '" + *keys.begin() + "' must be a string");
    }
    return value->get<std::string>();
}

json OptionalRow(const std::optional<json>& row) {
    return row ? *row : json(nullptr);
}

} // namespace

// Constructor
ScopedCapabilities::ScopedCapabilities(std::shared_ptr<CapabilityStore> store,
                                       core::ExecutionContext context)
    : store_(std::move(store))
    , context_(std::move(context)) {
    if (!store_) {
        throw std::invalid_argument("Capability store is required");
    }
    if (context_.project_id.empty()) {
        throw std::invalid_argument("Execution context requires a project id");
    }
}

std::string ScopedCapabilities::Actor() const {
    return context_.user_id.value_or("AI Agent");
}

json ScopedCapabilities::Invoke(CapabilityOperation operation, const json& args) const {
    spdlog::debug("Capability {} (project {})", OperationName(operation), context_.project_id);

    switch (operation) {
        case CapabilityOperation::STORIES_FIND_ACTIVE:
            return FindActiveStories();

        case CapabilityOperation::STORIES_FIND_ALL:
            return FindAllStories();

        case CapabilityOperation::STORIES_FIND_BY_KEY:
            return FindStoryByKey(RequireString(Argument(args, 0), "stories.findByKey", "key"));

        case CapabilityOperation::STORIES_UPDATE:
            return UpdateStory(RequireString(Argument(args, 0), "stories.update", "id"),
                               Argument(args, 1));

        case CapabilityOperation::MEETINGS_GET: {
            const json& id = Argument(args, 0);
            if (id.is_null()) {
                return GetMeeting(std::nullopt);
            }
            return GetMeeting(RequireString(id, "meetings.get", "id"));
        }

        case CapabilityOperation::RISKS_CREATE:
            return CreateRisk(Argument(args, 0));

        case CapabilityOperation::STORY_UPDATES_APPEND:
            return AppendStoryUpdate(Argument(args, 0));
    }

    throw CapabilityError("Unknown capability operation");
}

json ScopedCapabilities::FindActiveStories() const {
    return store_->FindStories(context_.project_id, true);
}

json ScopedCapabilities::FindAllStories() const {
    return store_->FindStories(context_.project_id, false);
}

json ScopedCapabilities::FindStoryByKey(const std::string& story_key) const {
    return OptionalRow(store_->FindStoryByKey(context_.project_id, story_key));
}

json ScopedCapabilities::UpdateStory(const std::string& story_id, const json& changes) const {
    if (!changes.is_object()) {
        throw CapabilityError("stories.update: 'changes' must be an object");
    }

    StoryChanges parsed;
    if (const json* status = Member(changes, {"status"})) {
        if (!status->is_string()) {
            throw CapabilityError("stories.update: 'status' must be a string");
        }
        parsed.status = status->get<std::string>();
    }
    if (const json* assignee = Member(changes, {"assigned_to", "assignedTo", "assignee"})) {
        if (!assignee->is_string()) {
            throw CapabilityError("stories.update: 'assigned_to' must be a string");
        }
        parsed.assigned_to = assignee->get<std::string>();
    }
    parsed.notes = AsText(Member(changes, {"notes"}));

    return store_->UpdateStory(context_.project_id, story_id, parsed);
}

json ScopedCapabilities::GetMeeting(const std::optional<std::string>& meeting_id) const {
    std::optional<std::string> id = meeting_id ? meeting_id : context_.meeting_id;
    if (!id) {
        throw CapabilityError("meetings.get: no meeting id given and none in the execution context");
    }
    return OptionalRow(store_->GetMeeting(context_.project_id, *id));
}

json ScopedCapabilities::CreateRisk(const json& data) const {
    if (!data.is_object()) {
        throw CapabilityError("risks.create: 'data' must be an object");
    }

    NewRisk risk;
    risk.project_id = context_.project_id;
    risk.title = StringMember(data, {"title"}, "risks.create", "");
    risk.description = StringMember(data, {"description"}, "risks.create", "");
    risk.risk_type = StringMember(data, {"riskType", "risk_type"}, "risks.create", risk.risk_type);
    risk.severity = StringMember(data, {"severity"}, "risks.create", risk.severity);
    risk.source_reference = context_.meeting_id;
    risk.created_by = Actor();

    if (const json* story_id = Member(data, {"storyId", "story_id"})) {
        risk.story_id = RequireString(*story_id, "risks.create", "storyId");
    }
    if (const json* stakeholders = Member(data, {"stakeholders"})) {
        if (!stakeholders->is_array()) {
            throw CapabilityError("risks.create: 'stakeholders' must be an array");
        }
        risk.stakeholders = *stakeholders;
    }
    if (const json* needs_meeting = Member(data, {"needsMeeting", "needs_meeting"})) {
        if (!needs_meeting->is_boolean()) {
            throw CapabilityError("risks.create: 'needsMeeting' must be a boolean");
        }
        risk.needs_meeting = needs_meeting->get<bool>();
    }

    return store_->CreateRisk(risk);
}

json ScopedCapabilities::AppendStoryUpdate(const json& data) const {
    if (!data.is_object()) {
        throw CapabilityError("storyUpdates.create: 'data' must be an object");
    }

    const json* story_id = Member(data, {"storyId", "story_id"});
    const json* field = Member(data, {"fieldChanged", "field_changed"});

    NewStoryUpdate update;
    update.project_id = context_.project_id;
    update.story_id = RequireString(story_id ? *story_id : json(), "storyUpdates.create", "storyId");
    update.field_changed = RequireString(field ? *field : json(), "storyUpdates.create", "fieldChanged");
    update.old_value = AsText(Member(data, {"oldValue", "old_value"}));
    update.new_value = AsText(Member(data, {"newValue", "new_value"}));
    update.update_notes = AsText(Member(data, {"notes", "update_notes"}));
    update.source_reference = context_.meeting_id;
    update.updated_by = Actor();

    return store_->AppendStoryUpdate(update);
}

} // namespace capabilities
} // namespace capsule
