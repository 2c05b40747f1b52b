/**
 * @file capability_store.hpp
 * @brief Backing-store contract behind the capability surface
 * 
 * The store is an external collaborator: rows travel as opaque JSON
 * objects and the engine never interprets them beyond the fields the
 * capability signatures name. Every method takes the project scope
 * explicitly and must never return or touch rows of another project.
 * 
 * Implementations are called concurrently from the host dispatcher's
 * worker threads and may block.
 * 
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace capsule {
namespace capabilities {

/**
 * @struct StoryChanges
 * @brief Allow-listed mutable story fields; unset fields are left untouched
 */
struct StoryChanges {
    std::optional<std::string> status;
    std::optional<std::string> assigned_to;
    std::optional<std::string> notes;

    bool Empty() const { return !status && !assigned_to && !notes; }
};

/**
 * @struct NewRisk
 * @brief Fully defaulted risk/blocker row to insert
 */
struct NewRisk {
    std::string project_id;
    std::optional<std::string> story_id;
    std::string title;
    std::string description;
    std::string risk_type{"blocker"};
    std::string severity{"high"};
    std::string status{"open"};
    nlohmann::json stakeholders = nlohmann::json::array();
    bool needs_meeting{false};
    std::optional<std::string> source_reference;   ///< Meeting the risk came from
    std::string created_by{"AI Agent"};
};

/**
 * @struct NewStoryUpdate
 * @brief Field-level before/after change record to append
 */
struct NewStoryUpdate {
    std::string project_id;                        ///< Scope the story must belong to
    std::string story_id;
    std::string field_changed;
    std::optional<std::string> old_value;
    std::optional<std::string> new_value;
    std::string source{"meeting"};
    std::optional<std::string> source_reference;   ///< Meeting the change came from
    std::optional<std::string> update_notes;
    std::string updated_by{"AI Agent"};
};

/**
 * @class CapabilityStore
 * @brief Abstract CRUD backend scoped by project
 * 
 * Failures (not-found, constraint violations) are reported by throwing
 * CapabilityError; the bridge turns them into rejected promises.
 */
class CapabilityStore {
public:
    virtual ~CapabilityStore() = default;

    /**
     * @brief Stories of a project ordered by story key
     * @param project_id Project scope
     * @param active_only Exclude stories whose status is "done"
     * @return JSON array of story rows
     */
    virtual nlohmann::json FindStories(const std::string& project_id, bool active_only) = 0;

    virtual std::optional<nlohmann::json> FindStoryByKey(const std::string& project_id,
                                                         const std::string& story_key) = 0;

    virtual std::optional<nlohmann::json> FindStoryById(const std::string& project_id,
                                                        const std::string& story_id) = 0;

    /**
     * @brief Apply a partial update and bump `updated_at`
     * @return Updated story row
     * @throws CapabilityError if the story is not in the project
     */
    virtual nlohmann::json UpdateStory(const std::string& project_id,
                                       const std::string& story_id,
                                       const StoryChanges& changes) = 0;

    virtual std::optional<nlohmann::json> GetMeeting(const std::string& project_id,
                                                     const std::string& meeting_id) = 0;

    /**
     * @return Inserted risk row, including generated id and timestamps
     */
    virtual nlohmann::json CreateRisk(const NewRisk& risk) = 0;

    /**
     * @return Inserted change record
     * @throws CapabilityError if the story is not in the project
     */
    virtual nlohmann::json AppendStoryUpdate(const NewStoryUpdate& update) = 0;
};

} // namespace capabilities
} // namespace capsule
