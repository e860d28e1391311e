#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <json/json.h>

namespace mockrun {

class JsonUtils {
public:
    // Strict parse (no comments, no trailing garbage). Returns false on any error.
    static bool try_parse(const std::string& text, Json::Value& out, std::string* error = nullptr);

    // Strict parse that throws ValidationError with the parser message
    static Json::Value parse_or_throw(const std::string& text, const std::string& what);

    // Single-line serialization
    static std::string to_compact(const Json::Value& value);

    // Locate the last well-formed JSON value in process output.
    // Tries the whole text, then single lines from the bottom up (objects and arrays
    // only), then multi-line values starting at a line that opens with '{' or '['.
    static std::optional<Json::Value> find_last_json_value(const std::string& text);

    // Serialized form cut to max_bytes, marked when cut
    static std::string truncated(const Json::Value& value, size_t max_bytes);

    // 2024-01-31T12:00:00.000Z
    static std::string iso8601(std::chrono::system_clock::time_point when);
    static std::string iso8601_now() { return iso8601(std::chrono::system_clock::now()); }

    // Object-or-empty accessors used when reading loosely typed request bodies
    static std::string get_string(const Json::Value& obj, const char* key,
                                  const std::string& fallback = "");
    static Json::Value get_object(const Json::Value& obj, const char* key);
};

} // namespace mockrun
