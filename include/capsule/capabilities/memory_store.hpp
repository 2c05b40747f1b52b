/**
 * @file memory_store.hpp
 * @brief In-process capability store seeded from JSON fixtures
 * 
 * Backs the command-line runner and the test suite. Mirrors the semantics
 * of the relational schema the capability surface was designed against:
 * story status and risk severity constraints, project scoping on every
 * lookup, generated UUIDs and ISO-8601 UTC timestamps on writes.
 * 
 * **Fixture Format**:
 * ```json
 * {
 *   "stories":       [{"id": "...", "project_id": "...", "story_key": "STORY-001",
 *                      "title": "...", "status": "ready", ...}],
 *   "meetings":      [{"id": "...", "project_id": "...", "title": "...", ...}],
 *   "risks":         [],
 *   "story_updates": []
 * }
 * ```
 * 
 * @date 2025
 */

#pragma once

#include "capsule/capabilities/capability_store.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

namespace capsule {
namespace capabilities {

/**
 * @class MemoryStore
 * @brief Thread-safe CapabilityStore over in-memory JSON rows
 * 
 * **Usage Example**:
 * @code
 * auto store = MemoryStore::LoadFromFile("fixtures.json");
 * core::ExecutionEngine engine(store);
 * auto result = engine.Execute("log((await stories.findAll()).length)", {"p-1"});
 * std::cout << store->Snapshot().dump(2) << std::endl;
 * @endcode
 */
class MemoryStore : public CapabilityStore {
public:
    MemoryStore() = default;

    /**
     * @brief Construct from a fixture document
     * @throws std::invalid_argument if a known collection is not an array
     *         of objects
     */
    explicit MemoryStore(const nlohmann::json& fixtures);

    ~MemoryStore() override = default;

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    /**
     * @brief Load fixtures from a JSON file
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static std::shared_ptr<MemoryStore> LoadFromFile(const std::filesystem::path& path);

    // Seeding helpers; rows without an id get a generated one
    nlohmann::json AddStory(nlohmann::json story);
    nlohmann::json AddMeeting(nlohmann::json meeting);

    /**
     * @brief Copy of every collection in fixture format
     */
    nlohmann::json Snapshot() const;

    nlohmann::json FindStories(const std::string& project_id, bool active_only) override;
    std::optional<nlohmann::json> FindStoryByKey(const std::string& project_id,
                                                 const std::string& story_key) override;
    std::optional<nlohmann::json> FindStoryById(const std::string& project_id,
                                                const std::string& story_id) override;
    nlohmann::json UpdateStory(const std::string& project_id,
                               const std::string& story_id,
                               const StoryChanges& changes) override;
    std::optional<nlohmann::json> GetMeeting(const std::string& project_id,
                                             const std::string& meeting_id) override;
    nlohmann::json CreateRisk(const NewRisk& risk) override;
    nlohmann::json AppendStoryUpdate(const NewStoryUpdate& update) override;

    /// Story statuses accepted by UpdateStory
    static const std::vector<std::string>& StoryStatuses();

    /// Risk severities accepted by CreateRisk
    static const std::vector<std::string>& RiskSeverities();

private:
    mutable std::mutex mutex_;
    std::vector<nlohmann::json> stories_;
    std::vector<nlohmann::json> meetings_;
    std::vector<nlohmann::json> risks_;
    std::vector<nlohmann::json> story_updates_;

    nlohmann::json* FindStoryLocked(const std::string& project_id, const std::string& story_id);
    static std::string CurrentTimestamp();
};

} // namespace capabilities
} // namespace capsule
