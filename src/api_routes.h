#pragma once

#include <json/json.h>
#include "http_server.h"
#include "orchestrator.h"

namespace mockrun {

// Caller identity, set by the authenticating gateway in front of the service
constexpr const char* USER_HEADER = "X-User-Id";

// POST /endpoints/{id}/execute, GET /endpoints/{id}/history, GET /health
void register_routes(HttpServer& server, Orchestrator& orchestrator);

// Reads {body, query, params, headers, mockDataCollectionId, environmentId,
// timeout, memoryLimit, requireIsolation}; throws ValidationError on wrong types
ExecuteInput parse_execute_input(const Json::Value& payload);

} // namespace mockrun
