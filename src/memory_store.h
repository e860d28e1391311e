#pragma once

#include <string>
#include <map>
#include <vector>
#include <deque>
#include <mutex>
#include "collaborators.h"
#include "constants.h"

namespace mockrun {

struct ProjectRecord {
    std::string id;
    std::string owner_id;
    std::map<std::string, bool> collaborators;   // user id -> can edit
    bool is_public = false;
};

struct EnvironmentRecord {
    std::string id;
    std::string project_id;
    std::string name;
    bool is_default = false;
    Json::Value variables{Json::objectValue};
};

// In-memory implementation of every collaborator, used by the demo server and tests.
// Saves are last-writer-wins; each save replaces the item array wholesale.
class MemoryStore : public AccessControl,
                    public EndpointStore,
                    public MockDataStore,
                    public VariableStore,
                    public ExecutionLogStore {
public:
    // Keeps at most max_log_records call log entries
    explicit MemoryStore(size_t max_log_records = MAX_RETAINED_LOG_RECORDS);

    // {projects, endpoints, collections, environments}; throws ValidationError on bad input
    void load(const Json::Value& fixture);
    void load_file(const std::string& path);

    void add_project(const ProjectRecord& project);
    void add_endpoint(const EndpointRecord& endpoint);
    void add_collection(const CollectionRecord& collection);
    void add_environment(const EnvironmentRecord& environment);

    // AccessControl
    bool can_edit_project(const std::string& user_id, const std::string& project_id) override;
    bool can_view_project(const std::string& user_id, const std::string& project_id) override;

    // EndpointStore
    std::optional<EndpointRecord> find_endpoint(const std::string& endpoint_id) override;
    void record_call(const std::string& endpoint_id,
                     std::chrono::system_clock::time_point when) override;

    // MockDataStore
    std::optional<CollectionRecord> find_collection(const std::string& collection_id) override;
    Json::Value save_from_execution(const std::string& collection_id,
                                    const Json::Value& items,
                                    const std::string& user_id,
                                    const Json::Value& context) override;

    // VariableStore
    Json::Value resolve(const std::string& project_id, const std::string& environment_id) override;

    // ExecutionLogStore
    void append(const ExecutionLogRecord& record) override;
    std::vector<ExecutionLogRecord> recent(const std::string& endpoint_id, size_t limit) override;

    // {previousData, previousVersion, backedUpAt} of the last save, null when never saved
    Json::Value backup_of(const std::string& collection_id);
    size_t log_count();

    // Item type check against {items:{properties:{field:{type}}, required:[...]}}.
    // Returns one message per violation.
    static std::vector<std::string> validate_against_schema(const Json::Value& items,
                                                            const Json::Value& schema);

private:
    bool can_edit_locked(const std::string& user_id, const std::string& project_id) const;

    struct SaveMetadata {
        Json::Value backup{Json::nullValue};
        std::string last_saved_by;
        std::string last_saved_at;
        Json::Value last_execution_context{Json::nullValue};
    };

    std::mutex mutex_;
    std::map<std::string, ProjectRecord> projects_;
    std::map<std::string, EndpointRecord> endpoints_;
    std::map<std::string, CollectionRecord> collections_;
    std::map<std::string, SaveMetadata> save_metadata_;
    std::vector<EnvironmentRecord> environments_;
    size_t max_log_records_;
    std::deque<ExecutionLogRecord> logs_;
};

} // namespace mockrun
