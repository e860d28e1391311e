#include "json_utils.h"
#include "errors.h"
#include <memory>
#include <sstream>
#include <iomanip>
#include <vector>
#include <ctime>

namespace mockrun {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

bool JsonUtils::try_parse(const std::string& text, Json::Value& out, std::string* error) {
    // strictMode() minus strictRoot: scalars are valid outputs too
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    builder["strictRoot"] = false;
    builder["rejectDupKeys"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    std::string errs;
    Json::Value parsed;
    bool ok = reader->parse(text.data(), text.data() + text.size(), &parsed, &errs);
    if (!ok) {
        if (error) *error = errs;
        return false;
    }
    out = std::move(parsed);
    return true;
}

Json::Value JsonUtils::parse_or_throw(const std::string& text, const std::string& what) {
    Json::Value value;
    std::string errs;
    if (!try_parse(text, value, &errs)) {
        throw ValidationError("Invalid JSON in " + what + ": " + trim(errs), "INVALID_JSON");
    }
    return value;
}

std::string JsonUtils::to_compact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

std::optional<Json::Value> JsonUtils::find_last_json_value(const std::string& text) {
    std::string whole = trim(text);
    if (whole.empty()) return std::nullopt;

    Json::Value value;
    if (try_parse(whole, value)) {
        return value;
    }

    auto lines = split_lines(whole);

    // Pretty-printed value that runs to the end of the output
    std::string tail;
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        tail = *it + (tail.empty() ? "" : "\n" + tail);
        std::string line = trim(*it);
        if (line.empty() || (line.front() != '{' && line.front() != '[')) continue;
        if (try_parse(trim(tail), value)) {
            return value;
        }
    }

    // Otherwise the newest single-line value
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        std::string line = trim(*it);
        if (line.empty() || (line.front() != '{' && line.front() != '[')) continue;
        if (try_parse(line, value)) {
            return value;
        }
    }

    return std::nullopt;
}

std::string JsonUtils::truncated(const Json::Value& value, size_t max_bytes) {
    std::string serialized = to_compact(value);
    if (serialized.size() <= max_bytes) return serialized;
    return serialized.substr(0, max_bytes) + "...(truncated)";
}

std::string JsonUtils::iso8601(std::chrono::system_clock::time_point when) {
    auto secs = std::chrono::system_clock::to_time_t(when);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        when.time_since_epoch()).count() % 1000;

    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);

    std::ostringstream out;
    out << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return out.str();
}

std::string JsonUtils::get_string(const Json::Value& obj, const char* key,
                                  const std::string& fallback) {
    if (!obj.isObject() || !obj.isMember(key) || !obj[key].isString()) {
        return fallback;
    }
    return obj[key].asString();
}

Json::Value JsonUtils::get_object(const Json::Value& obj, const char* key) {
    if (!obj.isObject() || !obj.isMember(key) || !obj[key].isObject()) {
        return Json::Value(Json::objectValue);
    }
    return obj[key];
}

} // namespace mockrun
