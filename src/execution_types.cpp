#include "execution_types.h"
#include "json_utils.h"

namespace mockrun {

std::string strategy_to_string(Strategy strategy) {
    switch (strategy) {
        case Strategy::LIGHT: return "light";
        case Strategy::HEAVY: return "heavy";
    }
    return "unknown";
}

std::optional<SaveDirective> SaveDirective::from_json(const Json::Value& value) {
    if (!value.isObject()) {
        return std::nullopt;
    }

    SaveDirective directive;
    directive.collection_id = JsonUtils::get_string(value, "collectionId");
    directive.collection_name = JsonUtils::get_string(value, "collectionName");
    directive.execution_id = JsonUtils::get_string(value, "executionId");
    directive.endpoint_id = JsonUtils::get_string(value, "endpointId");
    directive.user_id = JsonUtils::get_string(value, "userId");
    directive.project_id = JsonUtils::get_string(value, "projectId");
    directive.items = value.isMember("data") ? value["data"] : Json::Value(Json::nullValue);
    return directive;
}

Json::Value ExecutionContext::request_descriptor() const {
    Json::Value descriptor(Json::objectValue);
    descriptor["body"] = request.request.body;
    descriptor["query"] = request.request.query;
    descriptor["params"] = request.request.params;
    descriptor["headers"] = request.request.headers;
    descriptor["collection"] = JsonUtils::get_string(current_collection, "name");
    return descriptor;
}

} // namespace mockrun
