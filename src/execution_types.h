#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <json/json.h>
#include "constants.h"

namespace mockrun {

enum class Strategy {
    LIGHT,      // In-process QuickJS interpreter
    HEAVY       // Isolated process: namespaces + rlimits + seccomp
};

std::string strategy_to_string(Strategy strategy);

// Well-known key under which sandboxed code returns a pending write
constexpr const char* SAVE_OPERATION_KEY = "_saveOperation";

// A data mutation requested by sandboxed code. Applied only after the sandbox
// has exited successfully, and only by the Orchestrator.
struct SaveDirective {
    std::string collection_id;
    std::string collection_name;
    Json::Value items{Json::arrayValue};       // Full replacement array
    std::string execution_id;
    std::string endpoint_id;
    std::string user_id;
    std::string project_id;

    // Reads the sandbox-reported form; nullopt when value is not an object.
    // Missing fields stay empty, a non-array payload is kept as-is for the store to reject.
    static std::optional<SaveDirective> from_json(const Json::Value& value);
};

// Caller-facing HTTP request parts made visible to user code
struct RequestParts {
    Json::Value body{Json::objectValue};
    Json::Value query{Json::objectValue};
    Json::Value params{Json::objectValue};
    Json::Value headers{Json::objectValue};
};

// Fully resolved request for one execution. Built once by the Orchestrator.
struct ExecutionRequest {
    std::string execution_id;
    std::string code;
    std::string language = "javascript";
    std::chrono::milliseconds timeout{DEFAULT_TIMEOUT_MS};
    size_t memory_limit_mb = DEFAULT_MEMORY_LIMIT_MB;
    RequestParts request;
    std::string mock_data_collection_id;       // Empty when none selected
    std::string environment_id;                // Empty selects the project default
    std::string user_id;
    bool require_isolation = false;
};

// What the harness binds into the sandbox
struct ExecutionContext {
    ExecutionRequest request;
    Json::Value mock_data{Json::objectValue};           // { collectionName: [items] }
    Json::Value environment{Json::objectValue};         // Variables
    Json::Value current_collection{Json::objectValue};  // {name, id, itemCount, canSave}

    // Request descriptor as seen by user code
    Json::Value request_descriptor() const;
};

struct ExecutionResult {
    bool success = false;
    Json::Value output;                        // Structured value, or string for opaque stdout
    std::string error;
    std::vector<std::string> logs;
    std::chrono::milliseconds execution_time{0};
    Strategy strategy = Strategy::LIGHT;
    bool downgraded = false;                   // Heavy was wanted but Light ran
    bool cached = false;
    std::string environment_id;                // Heavy only
    std::optional<SaveDirective> save_directive;  // As reported by the sandbox
};

} // namespace mockrun
