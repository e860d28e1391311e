#include "memory_store.h"
#include "json_utils.h"
#include "errors.h"
#include <fstream>
#include <sstream>
#include <iostream>
#include <cmath>

namespace mockrun {

namespace {

// JavaScript typeof, with arrays reported as "array"
std::string js_type_of(const Json::Value& value) {
    switch (value.type()) {
        case Json::nullValue: return "object";
        case Json::booleanValue: return "boolean";
        case Json::intValue:
        case Json::uintValue:
        case Json::realValue: return "number";
        case Json::stringValue: return "string";
        case Json::arrayValue: return "array";
        case Json::objectValue: return "object";
    }
    return "undefined";
}

bool type_matches(const std::string& expected, const Json::Value& value) {
    std::string actual = js_type_of(value);
    if (expected == "integer") {
        return value.isNumeric() && std::floor(value.asDouble()) == value.asDouble();
    }
    return actual == expected;
}

} // namespace

MemoryStore::MemoryStore(size_t max_log_records)
    : max_log_records_(max_log_records) {}

void MemoryStore::load(const Json::Value& fixture) {
    if (!fixture.isObject()) {
        throw ValidationError("Fixture must be a JSON object", "INVALID_FIXTURE");
    }

    for (const auto& p : fixture["projects"]) {
        ProjectRecord project;
        project.id = JsonUtils::get_string(p, "id");
        project.owner_id = JsonUtils::get_string(p, "ownerId");
        project.is_public = p.get("visibility", "PRIVATE").asString() == "PUBLIC";
        for (const auto& c : p["collaborators"]) {
            project.collaborators[JsonUtils::get_string(c, "userId")] = c.get("canEdit", false).asBool();
        }
        add_project(project);
    }

    for (const auto& e : fixture["endpoints"]) {
        EndpointRecord endpoint;
        endpoint.id = JsonUtils::get_string(e, "id");
        endpoint.project_id = JsonUtils::get_string(e, "projectId");
        endpoint.name = JsonUtils::get_string(e, "name");
        endpoint.method = JsonUtils::get_string(e, "method", "GET");
        endpoint.path = JsonUtils::get_string(e, "path");
        endpoint.code = JsonUtils::get_string(e, "code");
        endpoint.language = JsonUtils::get_string(e, "language", "javascript");
        endpoint.timeout_ms = e.get("timeout", 0).asInt();
        endpoint.memory_limit_mb = e.get("memoryLimit", 0).asUInt();
        add_endpoint(endpoint);
    }

    for (const auto& c : fixture["collections"]) {
        CollectionRecord collection;
        collection.id = JsonUtils::get_string(c, "id");
        collection.project_id = JsonUtils::get_string(c, "projectId");
        collection.name = JsonUtils::get_string(c, "name");
        collection.items = c.get("data", Json::Value(Json::arrayValue));
        collection.schema = c.get("schema", Json::Value(Json::nullValue));
        collection.version = c.get("version", 1).asInt();
        add_collection(collection);
    }

    for (const auto& v : fixture["environments"]) {
        EnvironmentRecord environment;
        environment.id = JsonUtils::get_string(v, "id");
        environment.project_id = JsonUtils::get_string(v, "projectId");
        environment.name = JsonUtils::get_string(v, "name");
        environment.is_default = v.get("isDefault", false).asBool();
        environment.variables = JsonUtils::get_object(v, "variables");
        add_environment(environment);
    }
}

void MemoryStore::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ValidationError("Cannot open fixture file: " + path, "INVALID_FIXTURE");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    load(JsonUtils::parse_or_throw(buffer.str(), "fixture " + path));

    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "[Store] Loaded " << projects_.size() << " projects, " << endpoints_.size()
              << " endpoints, " << collections_.size() << " collections from " << path << std::endl;
}

void MemoryStore::add_project(const ProjectRecord& project) {
    std::lock_guard<std::mutex> lock(mutex_);
    projects_[project.id] = project;
}

void MemoryStore::add_endpoint(const EndpointRecord& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoints_[endpoint.id] = endpoint;
}

void MemoryStore::add_collection(const CollectionRecord& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    collections_[collection.id] = collection;
}

void MemoryStore::add_environment(const EnvironmentRecord& environment) {
    std::lock_guard<std::mutex> lock(mutex_);
    environments_.push_back(environment);
}

bool MemoryStore::can_edit_locked(const std::string& user_id, const std::string& project_id) const {
    auto it = projects_.find(project_id);
    if (it == projects_.end() || user_id.empty()) {
        return false;
    }
    if (it->second.owner_id == user_id) {
        return true;
    }
    auto collaborator = it->second.collaborators.find(user_id);
    return collaborator != it->second.collaborators.end() && collaborator->second;
}

bool MemoryStore::can_edit_project(const std::string& user_id, const std::string& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return can_edit_locked(user_id, project_id);
}

bool MemoryStore::can_view_project(const std::string& user_id, const std::string& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = projects_.find(project_id);
    if (it == projects_.end()) {
        return false;
    }
    return it->second.is_public || it->second.owner_id == user_id ||
           it->second.collaborators.count(user_id) > 0;
}

std::optional<EndpointRecord> MemoryStore::find_endpoint(const std::string& endpoint_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = endpoints_.find(endpoint_id);
    if (it == endpoints_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryStore::record_call(const std::string& endpoint_id,
                              std::chrono::system_clock::time_point when) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = endpoints_.find(endpoint_id);
    if (it != endpoints_.end()) {
        it->second.call_count++;
        it->second.last_called_at = JsonUtils::iso8601(when);
    }
}

std::optional<CollectionRecord> MemoryStore::find_collection(const std::string& collection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collections_.find(collection_id);
    if (it == collections_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> MemoryStore::validate_against_schema(const Json::Value& items,
                                                              const Json::Value& schema) {
    std::vector<std::string> errors;
    if (!schema.isObject() || !schema["items"].isObject() || !schema["items"]["properties"].isObject()) {
        return errors;
    }

    const Json::Value& properties = schema["items"]["properties"];
    const Json::Value& required = schema["items"]["required"];

    for (Json::ArrayIndex index = 0; index < items.size(); ++index) {
        const Json::Value& item = items[index];
        std::string prefix = "Item " + std::to_string(index);

        for (const auto& field : required) {
            std::string name = field.asString();
            if (!item.isObject() || !item.isMember(name) || item[name].isNull()) {
                errors.push_back(prefix + " missing required field: " + name);
            }
        }

        if (!item.isObject()) {
            continue;
        }
        for (const auto& key : item.getMemberNames()) {
            if (!properties.isMember(key) || !properties[key]["type"].isString()) {
                continue;
            }
            std::string expected = properties[key]["type"].asString();
            if (!type_matches(expected, item[key])) {
                errors.push_back(prefix + " field \"" + key + "\": expected " + expected +
                                 ", got " + js_type_of(item[key]));
            }
        }
    }
    return errors;
}

Json::Value MemoryStore::save_from_execution(const std::string& collection_id,
                                             const Json::Value& items,
                                             const std::string& user_id,
                                             const Json::Value& context) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = collections_.find(collection_id);
    if (it == collections_.end()) {
        std::cerr << "[Store] Collection " << collection_id << " not found" << std::endl;
        throw PersistenceError("COLLECTION_NOT_FOUND", "Collection not found: " + collection_id);
    }
    CollectionRecord& collection = it->second;

    if (!can_edit_locked(user_id, collection.project_id)) {
        std::cerr << "[Store] User " << user_id << " cannot edit collection " << collection_id << std::endl;
        throw PersistenceError("COLLECTION_EDIT_ACCESS_DENIED",
                               "No edit access to collection " + collection_id);
    }

    if (!items.isArray()) {
        throw PersistenceError("DATA_MUST_BE_ARRAY", "Data to save must be an array");
    }

    auto errors = validate_against_schema(items, collection.schema);
    if (!errors.empty()) {
        std::string joined;
        for (const auto& error : errors) {
            joined += (joined.empty() ? "" : ", ") + error;
        }
        throw PersistenceError("SCHEMA_VALIDATION_FAILED", "SCHEMA_VALIDATION_FAILED: " + joined);
    }

    std::string now = JsonUtils::iso8601_now();

    SaveMetadata& metadata = save_metadata_[collection_id];
    metadata.backup = Json::Value(Json::objectValue);
    metadata.backup["previousData"] = collection.items;
    metadata.backup["previousVersion"] = collection.version;
    metadata.backup["backedUpAt"] = now;
    metadata.last_saved_by = user_id;
    metadata.last_saved_at = now;
    metadata.last_execution_context = context;

    collection.items = items;
    collection.version += 1;
    collection.save_count += 1;

    std::cout << "[Store] Saved " << items.size() << " items to \"" << collection.name
              << "\" (v" << collection.version << ")" << std::endl;

    Json::Value result(Json::objectValue);
    result["success"] = true;
    result["message"] = "Saved " + std::to_string(items.size()) + " items to " + collection.name;
    result["collection"]["id"] = collection.id;
    result["collection"]["name"] = collection.name;
    result["collection"]["itemCount"] = static_cast<Json::UInt>(items.size());
    result["collection"]["version"] = collection.version;
    result["collection"]["updatedAt"] = now;
    result["executionContext"] = context;
    result["metadata"]["saveCount"] = collection.save_count;
    result["metadata"]["version"] = collection.version;
    return result;
}

Json::Value MemoryStore::resolve(const std::string& project_id, const std::string& environment_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& environment : environments_) {
        if (environment.project_id != project_id) {
            continue;
        }
        if (environment_id.empty() ? environment.is_default : environment.id == environment_id) {
            return environment.variables;
        }
    }
    return Json::Value(Json::objectValue);
}

void MemoryStore::append(const ExecutionLogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (max_log_records_ == 0) {
        return;
    }
    while (logs_.size() >= max_log_records_) {
        logs_.pop_front();
    }
    logs_.push_back(record);
}

std::vector<ExecutionLogRecord> MemoryStore::recent(const std::string& endpoint_id, size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ExecutionLogRecord> records;
    for (auto it = logs_.rbegin(); it != logs_.rend() && records.size() < limit; ++it) {
        if (it->endpoint_id == endpoint_id) {
            records.push_back(*it);
        }
    }
    return records;
}

Json::Value MemoryStore::backup_of(const std::string& collection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = save_metadata_.find(collection_id);
    if (it == save_metadata_.end()) {
        return Json::Value(Json::nullValue);
    }
    return it->second.backup;
}

size_t MemoryStore::log_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return logs_.size();
}

} // namespace mockrun
