#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <json/json.h>

namespace mockrun {

// Interfaces to the systems around the engine. The engine never stores
// projects, endpoints or collections itself.

struct EndpointRecord {
    std::string id;
    std::string project_id;
    std::string name;
    std::string method = "GET";
    std::string path;
    std::string code;
    std::string language = "javascript";
    int timeout_ms = 0;                    // 0 = engine default
    size_t memory_limit_mb = 0;            // 0 = engine default
    long call_count = 0;
    std::string last_called_at;            // ISO-8601, empty when never called
};

struct CollectionRecord {
    std::string id;
    std::string project_id;
    std::string name;
    Json::Value items{Json::arrayValue};
    Json::Value schema{Json::nullValue};
    int version = 1;
    int save_count = 0;
};

// Audit snapshot of one execution attempt
struct ExecutionLogRecord {
    std::string id;
    std::string endpoint_id;
    std::string project_id;
    std::string user_id;
    std::string method;
    std::string path;
    int status_code = 0;
    Json::Value request_body;
    Json::Value query_params;
    Json::Value path_params;
    Json::Value headers;
    Json::Value response_body;             // Truncated serialization, or null
    long response_time_ms = 0;
    std::vector<std::string> logs;
    std::string error;
    std::string sandbox_id;                // Heavy environment id, empty for Light
    std::string strategy;
    std::string mock_data_collection_id;
    std::string environment_id;
    Json::Value metadata{Json::objectValue};
    std::string created_at;

    // Fields returned by the history listing
    Json::Value to_summary_json() const;
};

class AccessControl {
public:
    virtual ~AccessControl() = default;
    virtual bool can_edit_project(const std::string& user_id, const std::string& project_id) = 0;
    virtual bool can_view_project(const std::string& user_id, const std::string& project_id) = 0;
};

class EndpointStore {
public:
    virtual ~EndpointStore() = default;
    virtual std::optional<EndpointRecord> find_endpoint(const std::string& endpoint_id) = 0;
    // Increments the call counter and stamps the last-called time
    virtual void record_call(const std::string& endpoint_id,
                             std::chrono::system_clock::time_point when) = 0;
};

class MockDataStore {
public:
    virtual ~MockDataStore() = default;
    virtual std::optional<CollectionRecord> find_collection(const std::string& collection_id) = 0;

    // Replaces the collection's items. Returns {success, message, collection, metadata};
    // throws PersistenceError.
    virtual Json::Value save_from_execution(const std::string& collection_id,
                                            const Json::Value& items,
                                            const std::string& user_id,
                                            const Json::Value& context) = 0;
};

class VariableStore {
public:
    virtual ~VariableStore() = default;
    // Variables of the named environment, or of the project's default one when
    // environment_id is empty. Empty object when neither exists.
    virtual Json::Value resolve(const std::string& project_id, const std::string& environment_id) = 0;
};

class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void append(const ExecutionLogRecord& record) = 0;
};

class ExecutionLogStore : public AuditSink {
public:
    // Newest first
    virtual std::vector<ExecutionLogRecord> recent(const std::string& endpoint_id, size_t limit) = 0;
};

} // namespace mockrun
