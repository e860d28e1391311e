#include "collaborators.h"

namespace mockrun {

Json::Value ExecutionLogRecord::to_summary_json() const {
    Json::Value json(Json::objectValue);
    json["id"] = id;
    json["statusCode"] = status_code;
    json["responseTime"] = static_cast<Json::Int64>(response_time_ms);
    json["error"] = error.empty() ? Json::Value(Json::nullValue) : Json::Value(error);
    json["createdAt"] = created_at;
    json["method"] = method;
    json["path"] = path;
    json["mockDataCollectionId"] = mock_data_collection_id.empty()
        ? Json::Value(Json::nullValue) : Json::Value(mock_data_collection_id);
    json["environmentId"] = environment_id.empty()
        ? Json::Value(Json::nullValue) : Json::Value(environment_id);
    json["metadata"] = metadata;
    return json;
}

} // namespace mockrun
