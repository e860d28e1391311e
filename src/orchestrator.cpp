#include "orchestrator.h"
#include "hash_utils.h"
#include "json_utils.h"
#include "errors.h"
#include <iostream>

namespace mockrun {

namespace {

// Value as-is when its serialization fits, otherwise the truncated serialization
Json::Value bounded(const Json::Value& value) {
    std::string serialized = JsonUtils::to_compact(value);
    if (serialized.size() <= MAX_LOGGED_BODY_BYTES) {
        return value;
    }
    return Json::Value(JsonUtils::truncated(value, MAX_LOGGED_BODY_BYTES));
}

long elapsed_ms(std::chrono::steady_clock::time_point start) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
}

} // namespace

Json::Value ExecutionResponse::to_json() const {
    Json::Value json(Json::objectValue);
    json["success"] = success;
    json["data"] = data;
    json["error"] = error.empty() ? Json::Value(Json::nullValue) : Json::Value(error);

    Json::Value log_lines(Json::arrayValue);
    for (const auto& line : logs) {
        log_lines.append(line);
    }
    json["logs"] = log_lines;
    json["executionTime"] = static_cast<Json::Int64>(execution_time.count());
    json["savedData"] = saved_data;
    json["executionId"] = execution_id;
    json["strategy"] = strategy_to_string(strategy);
    json["isolationDowngraded"] = isolation_downgraded;
    json["cached"] = cached;
    json["timestamp"] = timestamp;
    return json;
}

Orchestrator::Orchestrator(CodeExecutor& executor, EnvironmentManager& environments,
                           RateLimiter& rate_limiter, const Collaborators& collaborators)
    : executor_(executor), environments_(environments), rate_limiter_(rate_limiter),
      collaborators_(collaborators) {}

ExecutionRequest Orchestrator::build_request(const EndpointRecord& endpoint, const std::string& user_id,
                                             const std::string& execution_id,
                                             const ExecuteInput& input) const {
    int timeout_ms = input.timeout_ms.value_or(endpoint.timeout_ms > 0 ? endpoint.timeout_ms : DEFAULT_TIMEOUT_MS);
    if (timeout_ms < MIN_TIMEOUT_MS || timeout_ms > MAX_TIMEOUT_MS) {
        throw ValidationError("Timeout must be between " + std::to_string(MIN_TIMEOUT_MS) + "ms and " +
                              std::to_string(MAX_TIMEOUT_MS) + "ms");
    }

    int memory_mb = input.memory_limit_mb.value_or(
        endpoint.memory_limit_mb > 0 ? static_cast<int>(endpoint.memory_limit_mb)
                                     : static_cast<int>(DEFAULT_MEMORY_LIMIT_MB));
    if (memory_mb < static_cast<int>(MIN_MEMORY_LIMIT_MB) || memory_mb > static_cast<int>(MAX_MEMORY_LIMIT_MB)) {
        throw ValidationError("Memory limit must be between " + std::to_string(MIN_MEMORY_LIMIT_MB) +
                              "MB and " + std::to_string(MAX_MEMORY_LIMIT_MB) + "MB");
    }

    ExecutionRequest request;
    request.execution_id = execution_id;
    request.code = endpoint.code;
    request.language = endpoint.language.empty() ? "javascript" : endpoint.language;
    request.timeout = std::chrono::milliseconds(timeout_ms);
    request.memory_limit_mb = static_cast<size_t>(memory_mb);
    request.request = input.request;
    request.mock_data_collection_id = input.mock_data_collection_id;
    request.environment_id = input.environment_id;
    request.user_id = user_id;
    request.require_isolation = input.require_isolation;
    return request;
}

ExecutionContext Orchestrator::build_context(const ExecutionRequest& request, const EndpointRecord& endpoint,
                                             const std::optional<CollectionRecord>& collection) {
    ExecutionContext context;
    context.request = request;

    if (collection) {
        context.mock_data[collection->name] = collection->items;
        context.current_collection["name"] = collection->name;
        context.current_collection["id"] = collection->id;
        context.current_collection["itemCount"] = collection->items.size();
        context.current_collection["canSave"] = true;
    } else {
        context.current_collection["name"] = "";
        context.current_collection["id"] = "";
        context.current_collection["itemCount"] = 0;
        context.current_collection["canSave"] = false;
    }

    context.environment = collaborators_.variables.resolve(endpoint.project_id, request.environment_id);
    return context;
}

std::optional<SaveDirective> Orchestrator::complete_directive(const ExecutionResult& result,
                                                              const ExecutionRequest& request,
                                                              const EndpointRecord& endpoint) const {
    if (!result.save_directive) {
        return std::nullopt;
    }

    // What the request knows always wins over what the sandbox reported
    SaveDirective directive = *result.save_directive;
    if (!request.mock_data_collection_id.empty()) {
        directive.collection_id = request.mock_data_collection_id;
    }
    directive.execution_id = request.execution_id;
    directive.endpoint_id = endpoint.id;
    directive.user_id = request.user_id;
    directive.project_id = endpoint.project_id;
    return directive;
}

Json::Value Orchestrator::apply_save(const SaveDirective& directive, const ExecutionRequest& request) {
    Json::Value results(Json::arrayValue);
    int count = 0;

    try {
        if (request.mock_data_collection_id.empty()) {
            throw PersistenceError("COLLECTION_NOT_SELECTED",
                                   "Save requested without a selected mock data collection");
        }

        Json::Value context(Json::objectValue);
        context["endpointId"] = directive.endpoint_id;
        context["executionId"] = directive.execution_id;

        results.append(collaborators_.mock_data.save_from_execution(
            directive.collection_id, directive.items, directive.user_id, context));
        ++count;
    } catch (const ExecutionError& e) {
        std::cerr << "[Orchestrator] Save for " << request.execution_id << " failed: "
                  << e.code() << ": " << e.what() << std::endl;
        Json::Value failure(Json::objectValue);
        failure["success"] = false;
        failure["error"] = e.code();
        failure["message"] = e.what();
        failure["collectionId"] = directive.collection_id;
        results.append(failure);
    }

    Json::Value saved(Json::objectValue);
    saved["count"] = count;
    saved["results"] = results;
    return saved;
}

void Orchestrator::write_log(const ExecutionLogRecord& record) {
    try {
        collaborators_.logs.append(record);
    } catch (const std::exception& e) {
        std::cerr << "[Orchestrator] Failed to log execution " << record.id << ": " << e.what() << std::endl;
    }
}

ExecutionResponse Orchestrator::execute(const std::string& endpoint_id, const std::string& user_id,
                                        const ExecuteInput& input) {
    auto start_time = std::chrono::steady_clock::now();
    std::string execution_id = HashUtils::generate_execution_id();

    auto endpoint = collaborators_.endpoints.find_endpoint(endpoint_id);
    if (!endpoint) {
        throw NotFound("ENDPOINT_NOT_FOUND", "Endpoint not found: " + endpoint_id);
    }

    ExecutionLogRecord record;
    record.id = execution_id;
    record.endpoint_id = endpoint->id;
    record.project_id = endpoint->project_id;
    record.user_id = user_id;
    record.method = endpoint->method;
    record.path = endpoint->path;
    record.request_body = bounded(input.request.body);
    record.query_params = bounded(input.request.query);
    record.path_params = bounded(input.request.params);
    record.headers = bounded(input.request.headers);
    record.response_body = Json::Value(Json::nullValue);
    record.mock_data_collection_id = input.mock_data_collection_id;
    record.environment_id = input.environment_id;
    record.created_at = JsonUtils::iso8601_now();

    try {
        // VALIDATE
        ExecutionRequest request = build_request(*endpoint, user_id, execution_id, input);
        executor_.validate(request.code, request.language);

        // AUTHORIZE
        if (!collaborators_.access.can_edit_project(user_id, endpoint->project_id)) {
            throw AccessDenied("No edit access to the endpoint's project");
        }
        std::optional<CollectionRecord> collection;
        if (!request.mock_data_collection_id.empty()) {
            collection = collaborators_.mock_data.find_collection(request.mock_data_collection_id);
            if (!collection) {
                throw NotFound("COLLECTION_NOT_FOUND",
                               "Mock data collection not found: " + request.mock_data_collection_id);
            }
            if (!collaborators_.access.can_edit_project(user_id, collection->project_id)) {
                throw AccessDenied("No edit access to the collection's project");
            }
        }

        rate_limiter_.acquire(user_id);

        // CONTEXT_BUILD
        ExecutionContext context = build_context(request, *endpoint, collection);

        // EXECUTE
        StrategyOptions options;
        options.language = request.language;
        options.require_isolation = request.require_isolation;
        StrategyDecision decision = executor_.select_strategy(request.code, options);
        record.strategy = strategy_to_string(decision.strategy);

        ++total_executions_;
        ExecutionResult result = executor_.execute(decision, context);

        // OUTPUT_PARSE
        std::optional<SaveDirective> directive = complete_directive(result, request, *endpoint);

        // APPLY_SAVE
        Json::Value saved_data(Json::nullValue);
        if (directive) {
            saved_data = apply_save(*directive, request);
        }

        ExecutionResponse response;
        response.success = result.success;
        response.data = result.output;
        response.error = result.error;
        response.logs = result.logs;
        response.execution_time = std::chrono::milliseconds(elapsed_ms(start_time));
        response.saved_data = saved_data;
        response.execution_id = execution_id;
        response.strategy = result.strategy;
        response.isolation_downgraded = result.downgraded;
        response.cached = result.cached;
        response.timestamp = JsonUtils::iso8601_now();

        // LOG
        record.status_code = response.status_code();
        record.response_body = bounded(response.success ? response.data : Json::Value(response.error));
        record.response_time_ms = response.execution_time.count();
        record.logs = result.logs;
        record.error = result.error;
        record.sandbox_id = result.environment_id;
        record.strategy = strategy_to_string(result.strategy);
        record.metadata["pendingSaves"] = directive ? 1 : 0;
        record.metadata["isolationDowngraded"] = result.downgraded;
        record.metadata["cached"] = result.cached;
        record.metadata["timestamp"] = response.timestamp;
        write_log(record);

        if (response.success) {
            try {
                collaborators_.endpoints.record_call(endpoint->id, std::chrono::system_clock::now());
            } catch (const std::exception& e) {
                std::cerr << "[Orchestrator] Failed to update call counter for " << endpoint->id
                          << ": " << e.what() << std::endl;
            }
        }

        std::cout << "[Orchestrator] " << execution_id << " on " << endpoint->id << " -> "
                  << record.status_code << " (" << record.strategy << ", "
                  << response.execution_time.count() << "ms)" << std::endl;

        // RESPOND
        return response;
    } catch (const ExecutionError& e) {
        record.status_code = e.status();
        record.error = e.code() + ": " + e.what();
        record.response_time_ms = elapsed_ms(start_time);
        record.metadata["timestamp"] = JsonUtils::iso8601_now();
        write_log(record);
        std::cerr << "[Orchestrator] " << execution_id << " on " << endpoint->id << " failed: "
                  << record.error << std::endl;
        throw;
    } catch (const std::exception& e) {
        record.status_code = 500;
        record.error = std::string("INTERNAL_ERROR: ") + e.what();
        record.response_time_ms = elapsed_ms(start_time);
        record.metadata["timestamp"] = JsonUtils::iso8601_now();
        write_log(record);
        throw;
    }
}

std::vector<ExecutionLogRecord> Orchestrator::history(const std::string& endpoint_id,
                                                      const std::string& user_id, size_t limit) {
    auto endpoint = collaborators_.endpoints.find_endpoint(endpoint_id);
    if (!endpoint) {
        throw NotFound("ENDPOINT_NOT_FOUND", "Endpoint not found: " + endpoint_id);
    }
    if (!collaborators_.access.can_view_project(user_id, endpoint->project_id)) {
        throw AccessDenied("No access to the endpoint's project");
    }
    return collaborators_.logs.recent(endpoint_id, limit);
}

Json::Value Orchestrator::health() {
    EnvironmentHealth environments = environments_.health_check();

    Json::Value json(Json::objectValue);
    json["status"] = environments.healthy ? "healthy" : "degraded";
    json["heavyBackend"]["status"] = environments.healthy ? "HEALTHY" : "UNHEALTHY";
    if (!environments.healthy) {
        json["heavyBackend"]["reason"] = environments.reason;
    }
    json["activeEnvironments"] = static_cast<Json::UInt64>(environments.active);
    json["maxEnvironments"] = static_cast<Json::UInt64>(environments.max_environments);
    json["totalExecutions"] = static_cast<Json::UInt64>(total_executions_.load());
    json["rateLimitCeiling"] = rate_limiter_.limit();
    json["totalUsers"] = static_cast<Json::UInt64>(rate_limiter_.tracked_users());
    json["cacheSize"] = static_cast<Json::UInt64>(executor_.cache().size());
    return json;
}

} // namespace mockrun
