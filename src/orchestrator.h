#pragma once

#include <string>
#include <vector>
#include <optional>
#include <atomic>
#include <json/json.h>
#include "constants.h"
#include "execution_types.h"
#include "collaborators.h"
#include "code_executor.h"
#include "environment_manager.h"
#include "rate_limiter.h"

namespace mockrun {

// What a caller supplies when invoking an endpoint
struct ExecuteInput {
    RequestParts request;
    std::string mock_data_collection_id;
    std::string environment_id;
    std::optional<int> timeout_ms;
    std::optional<int> memory_limit_mb;
    bool require_isolation = false;
};

// Caller-facing result of one execution
struct ExecutionResponse {
    bool success = false;
    Json::Value data;
    std::string error;
    std::vector<std::string> logs;
    std::chrono::milliseconds execution_time{0};
    Json::Value saved_data{Json::nullValue};   // {count, results} when a save was requested
    std::string execution_id;
    Strategy strategy = Strategy::LIGHT;
    bool isolation_downgraded = false;
    bool cached = false;
    std::string timestamp;

    int status_code() const { return success ? 200 : 500; }
    Json::Value to_json() const;
};

// Drives one request through
// VALIDATE -> AUTHORIZE -> CONTEXT_BUILD -> EXECUTE -> OUTPUT_PARSE -> APPLY_SAVE -> LOG -> RESPOND.
// LOG runs for every request whose endpoint resolved, including failed ones.
class Orchestrator {
public:
    struct Collaborators {
        AccessControl& access;
        EndpointStore& endpoints;
        MockDataStore& mock_data;
        VariableStore& variables;
        ExecutionLogStore& logs;
    };

    Orchestrator(CodeExecutor& executor, EnvironmentManager& environments,
                 RateLimiter& rate_limiter, const Collaborators& collaborators);

    // Throws ExecutionError subclasses for everything except runtime errors in
    // user code, which come back as success=false.
    ExecutionResponse execute(const std::string& endpoint_id, const std::string& user_id,
                              const ExecuteInput& input);

    std::vector<ExecutionLogRecord> history(const std::string& endpoint_id, const std::string& user_id,
                                            size_t limit = DEFAULT_HISTORY_LIMIT);

    Json::Value health();

    size_t total_executions() const { return total_executions_.load(); }

private:
    ExecutionRequest build_request(const EndpointRecord& endpoint, const std::string& user_id,
                                   const std::string& execution_id, const ExecuteInput& input) const;
    ExecutionContext build_context(const ExecutionRequest& request, const EndpointRecord& endpoint,
                                   const std::optional<CollectionRecord>& collection);
    std::optional<SaveDirective> complete_directive(const ExecutionResult& result,
                                                    const ExecutionRequest& request,
                                                    const EndpointRecord& endpoint) const;
    Json::Value apply_save(const SaveDirective& directive, const ExecutionRequest& request);
    void write_log(const ExecutionLogRecord& record);

    CodeExecutor& executor_;
    EnvironmentManager& environments_;
    RateLimiter& rate_limiter_;
    Collaborators collaborators_;
    std::atomic<size_t> total_executions_{0};
};

} // namespace mockrun
