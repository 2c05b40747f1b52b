/**
 * @file memory_store.cpp
 * @brief Implementation of the in-process capability store
 * 
 * Every lookup filters on `project_id` first; rows of other projects are
 * indistinguishable from rows that do not exist.
 * 
 * @date 2025
 */

#include "capsule/capabilities/memory_store.hpp"
#include "capsule/capabilities/capability.hpp"
#include "capsule/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace capsule {
namespace capabilities {

namespace {

// String value of a row field, or empty when absent or not a string
std::string FieldString(const json& row, const char* key) {
    auto it = row.find(key);
    if (it == row.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

json OptionalToJson(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

void LoadCollection(const json& fixtures, const char* key, std::vector<json>& target) {
    auto it = fixtures.find(key);
    if (it == fixtures.end() || it->is_null()) {
        return;
    }
    if (!it->is_array()) {
        throw std::invalid_argument(std::string("Fixture collection '") + key + "' must be an array");
    }
    for (const auto& row : *it) {
        if (!row.is_object()) {
            throw std::invalid_argument(std::string("Fixture collection '") + key +
                                        "' must contain only objects");
        }
        target.push_back(row);
    }
}

} // namespace

// Constructor
MemoryStore::MemoryStore(const json& fixtures) {
    if (!fixtures.is_object()) {
        throw std::invalid_argument("Fixture document must be a JSON object");
    }

    LoadCollection(fixtures, "stories", stories_);
    LoadCollection(fixtures, "meetings", meetings_);
    LoadCollection(fixtures, "risks", risks_);
    LoadCollection(fixtures, "story_updates", story_updates_);

    spdlog::debug("Memory store loaded: {} stories, {} meetings, {} risks, {} story updates",
                  stories_.size(), meetings_.size(), risks_.size(), story_updates_.size());
}

std::shared_ptr<MemoryStore> MemoryStore::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open fixture file: " + path.string());
    }

    json fixtures;
    try {
        file >> fixtures;
    }
    catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid fixture file " + path.string() + ": " + e.what());
    }

    spdlog::info("Loaded fixtures from {}", path.string());
    return std::make_shared<MemoryStore>(fixtures);
}

const std::vector<std::string>& MemoryStore::StoryStatuses() {
    static const std::vector<std::string> statuses = {
        "draft", "ready", "in_progress", "review", "on_hold", "done"
    };
    return statuses;
}

const std::vector<std::string>& MemoryStore::RiskSeverities() {
    static const std::vector<std::string> severities = {
        "critical", "high", "medium", "low"
    };
    return severities;
}

// ISO-8601 UTC, second precision
std::string MemoryStore::CurrentTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// ============================================================================
// SEEDING AND SNAPSHOTS
// ============================================================================

json MemoryStore::AddStory(json story) {
    if (!story.is_object()) {
        throw std::invalid_argument("Story must be a JSON object");
    }
    if (FieldString(story, "id").empty()) {
        story["id"] = utils::HashUtils::GenerateUuid();
    }
    if (!story.contains("status")) {
        story["status"] = "draft";
    }
    std::string now = CurrentTimestamp();
    if (!story.contains("created_at")) story["created_at"] = now;
    if (!story.contains("updated_at")) story["updated_at"] = now;

    std::lock_guard<std::mutex> lock(mutex_);
    stories_.push_back(story);
    return story;
}

json MemoryStore::AddMeeting(json meeting) {
    if (!meeting.is_object()) {
        throw std::invalid_argument("Meeting must be a JSON object");
    }
    if (FieldString(meeting, "id").empty()) {
        meeting["id"] = utils::HashUtils::GenerateUuid();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    meetings_.push_back(meeting);
    return meeting;
}

json MemoryStore::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return json{
        {"stories", stories_},
        {"meetings", meetings_},
        {"risks", risks_},
        {"story_updates", story_updates_}
    };
}

// ============================================================================
// LOOKUPS
// ============================================================================

json MemoryStore::FindStories(const std::string& project_id, bool active_only) {
    std::vector<json> matches;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& story : stories_) {
            if (FieldString(story, "project_id") != project_id) {
                continue;
            }
            if (active_only && FieldString(story, "status") == "done") {
                continue;
            }
            matches.push_back(story);
        }
    }

    // ORDER BY story_key, rows without a key last
    std::stable_sort(matches.begin(), matches.end(), [](const json& a, const json& b) {
        std::string ka = FieldString(a, "story_key");
        std::string kb = FieldString(b, "story_key");
        if (ka.empty() != kb.empty()) {
            return kb.empty();
        }
        return ka < kb;
    });

    return json(matches);
}

std::optional<json> MemoryStore::FindStoryByKey(const std::string& project_id,
                                                const std::string& story_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& story : stories_) {
        if (FieldString(story, "project_id") == project_id &&
            FieldString(story, "story_key") == story_key) {
            return story;
        }
    }
    return std::nullopt;
}

std::optional<json> MemoryStore::FindStoryById(const std::string& project_id,
                                               const std::string& story_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    json* story = FindStoryLocked(project_id, story_id);
    if (!story) {
        return std::nullopt;
    }
    return *story;
}

json* MemoryStore::FindStoryLocked(const std::string& project_id, const std::string& story_id) {
    for (auto& story : stories_) {
        if (FieldString(story, "project_id") == project_id &&
            FieldString(story, "id") == story_id) {
            return &story;
        }
    }
    return nullptr;
}

std::optional<json> MemoryStore::GetMeeting(const std::string& project_id,
                                            const std::string& meeting_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& meeting : meetings_) {
        if (FieldString(meeting, "project_id") == project_id &&
            FieldString(meeting, "id") == meeting_id) {
            return meeting;
        }
    }
    return std::nullopt;
}

// ============================================================================
// MUTATIONS
// ============================================================================

json MemoryStore::UpdateStory(const std::string& project_id,
                              const std::string& story_id,
                              const StoryChanges& changes) {
    if (changes.status) {
        const auto& statuses = StoryStatuses();
        if (std::find(statuses.begin(), statuses.end(), *changes.status) == statuses.end()) {
            throw CapabilityError("Invalid story status: " + *changes.status);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    json* story = FindStoryLocked(project_id, story_id);
    if (!story) {
        throw CapabilityError("Story not found: " + story_id);
    }

    if (changes.status)      (*story)["status"] = *changes.status;
    if (changes.assigned_to) (*story)["assigned_to"] = *changes.assigned_to;
    if (changes.notes)       (*story)["notes"] = *changes.notes;
    (*story)["updated_at"] = CurrentTimestamp();

    return *story;
}

json MemoryStore::CreateRisk(const NewRisk& risk) {
    if (risk.title.empty()) {
        throw CapabilityError("Risk title is required");
    }
    if (risk.description.empty()) {
        throw CapabilityError("Risk description is required");
    }
    const auto& severities = RiskSeverities();
    if (std::find(severities.begin(), severities.end(), risk.severity) == severities.end()) {
        throw CapabilityError("Invalid risk severity: " + risk.severity);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (risk.story_id && !FindStoryLocked(risk.project_id, *risk.story_id)) {
        throw CapabilityError("Story not found: " + *risk.story_id);
    }

    std::string now = CurrentTimestamp();
    json row = {
        {"id", utils::HashUtils::GenerateUuid()},
        {"project_id", risk.project_id},
        {"story_id", OptionalToJson(risk.story_id)},
        {"title", risk.title},
        {"description", risk.description},
        {"severity", risk.severity},
        {"risk_type", risk.risk_type},
        {"source_reference", OptionalToJson(risk.source_reference)},
        {"status", risk.status},
        {"stakeholders", risk.stakeholders},
        {"needs_meeting", risk.needs_meeting},
        {"created_by", risk.created_by},
        {"created_at", now},
        {"updated_at", now}
    };

    risks_.push_back(row);
    return row;
}

json MemoryStore::AppendStoryUpdate(const NewStoryUpdate& update) {
    if (update.field_changed.empty()) {
        throw CapabilityError("fieldChanged is required");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!FindStoryLocked(update.project_id, update.story_id)) {
        throw CapabilityError("Story not found: " + update.story_id);
    }

    json row = {
        {"id", utils::HashUtils::GenerateUuid()},
        {"story_id", update.story_id},
        {"field_changed", update.field_changed},
        {"old_value", OptionalToJson(update.old_value)},
        {"new_value", OptionalToJson(update.new_value)},
        {"source", update.source},
        {"source_reference", OptionalToJson(update.source_reference)},
        {"update_notes", OptionalToJson(update.update_notes)},
        {"updated_by", update.updated_by},
        {"created_at", CurrentTimestamp()}
    };

    story_updates_.push_back(row);
    return row;
}

} // namespace capabilities
} // namespace capsule
