#include "api_routes.h"
#include "json_utils.h"
#include "errors.h"
#include <iostream>

namespace mockrun {

namespace {

std::string require_user(const HttpRequest& req) {
    std::string user_id = req.header(USER_HEADER);
    if (user_id.empty()) {
        throw AccessDenied(std::string("Missing ") + USER_HEADER + " header");
    }
    return user_id;
}

std::optional<int> optional_int(const Json::Value& payload, const char* key) {
    if (!payload.isMember(key) || payload[key].isNull()) {
        return std::nullopt;
    }
    if (!payload[key].isInt()) {
        throw ValidationError(std::string(key) + " must be an integer");
    }
    return payload[key].asInt();
}

std::string optional_string(const Json::Value& payload, const char* key) {
    if (!payload.isMember(key) || payload[key].isNull()) {
        return "";
    }
    if (!payload[key].isString()) {
        throw ValidationError(std::string(key) + " must be a string");
    }
    return payload[key].asString();
}

Json::Value optional_object(const Json::Value& payload, const char* key) {
    if (!payload.isMember(key) || payload[key].isNull()) {
        return Json::Value(Json::objectValue);
    }
    if (!payload[key].isObject()) {
        throw ValidationError(std::string(key) + " must be an object");
    }
    return payload[key];
}

HttpResponse json_response(int status, const Json::Value& body) {
    HttpResponse resp;
    resp.status_code = status;
    resp.body = JsonUtils::to_compact(body);
    return resp;
}

} // namespace

ExecuteInput parse_execute_input(const Json::Value& payload) {
    if (!payload.isObject()) {
        throw ValidationError("Request body must be a JSON object");
    }

    ExecuteInput input;
    input.request.body = payload.isMember("body") ? payload["body"] : Json::Value(Json::objectValue);
    input.request.query = optional_object(payload, "query");
    input.request.params = optional_object(payload, "params");
    input.request.headers = optional_object(payload, "headers");
    input.mock_data_collection_id = optional_string(payload, "mockDataCollectionId");
    input.environment_id = optional_string(payload, "environmentId");
    input.timeout_ms = optional_int(payload, "timeout");
    input.memory_limit_mb = optional_int(payload, "memoryLimit");

    if (payload.isMember("requireIsolation")) {
        if (!payload["requireIsolation"].isBool()) {
            throw ValidationError("requireIsolation must be a boolean");
        }
        input.require_isolation = payload["requireIsolation"].asBool();
    }
    return input;
}

void register_routes(HttpServer& server, Orchestrator& orchestrator) {
    server.route("POST", "/endpoints/{id}/execute", [&orchestrator](const HttpRequest& req) {
        std::string user_id = require_user(req);
        Json::Value payload(Json::objectValue);
        if (req.body.find_first_not_of(" \t\r\n") != std::string::npos) {
            payload = JsonUtils::parse_or_throw(req.body, "request body");
        }
        ExecuteInput input = parse_execute_input(payload);

        try {
            ExecutionResponse response = orchestrator.execute(req.path_params.at("id"), user_id, input);
            return json_response(response.status_code(), response.to_json());
        } catch (const RateLimitExceeded& e) {
            Json::Value body(Json::objectValue);
            body["success"] = false;
            body["error"] = e.code();
            body["message"] = e.what();
            body["retryAfter"] = static_cast<Json::Int64>(e.retry_after().count());
            HttpResponse resp = json_response(e.status(), body);
            resp.headers["Retry-After"] = std::to_string(e.retry_after().count());
            return resp;
        }
    });

    server.route("GET", "/endpoints/{id}/history", [&orchestrator](const HttpRequest& req) {
        std::string user_id = require_user(req);
        size_t limit = DEFAULT_HISTORY_LIMIT;
        auto it = req.query.find("limit");
        if (it != req.query.end()) {
            int parsed = 0;
            try {
                parsed = std::stoi(it->second);
            } catch (const std::exception&) {
                parsed = 0;
            }
            if (parsed < 1 || parsed > 100) {
                throw ValidationError("limit must be between 1 and 100");
            }
            limit = static_cast<size_t>(parsed);
        }

        Json::Value records(Json::arrayValue);
        for (const auto& record : orchestrator.history(req.path_params.at("id"), user_id, limit)) {
            records.append(record.to_summary_json());
        }

        Json::Value body(Json::objectValue);
        body["success"] = true;
        body["data"] = records;
        return json_response(200, body);
    });

    server.route("GET", "/health", [&orchestrator](const HttpRequest&) {
        return json_response(200, orchestrator.health());
    });
}

} // namespace mockrun
