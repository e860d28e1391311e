#include "result_cache.h"
#include "hash_utils.h"
#include "json_utils.h"

namespace mockrun {

ResultCache::ResultCache(std::chrono::milliseconds ttl) : ttl_(ttl) {}

std::string ResultCache::compute_key(const ExecutionContext& context, Strategy strategy) {
    // jsoncpp keeps object members sorted, so the serialization is canonical
    Json::Value material(Json::objectValue);
    material["code"] = context.request.code;
    material["language"] = context.request.language;
    material["strategy"] = strategy_to_string(strategy);
    material["mockData"] = context.mock_data;
    material["environment"] = context.environment;
    material["request"] = context.request_descriptor();
    material["currentCollection"] = context.current_collection;
    return HashUtils::sha256_string(JsonUtils::to_compact(material));
}

std::optional<ExecutionResult> ResultCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (now - it->second.inserted_at >= ttl_) {
        entries_.erase(it);
        return std::nullopt;
    }

    ExecutionResult copy = it->second.result;
    copy.cached = true;
    return copy;
}

void ResultCache::put(const std::string& key, const ExecutionResult& result) {
    if (!result.success) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    purge_expired_locked(now);
    entries_[key] = Entry{result, now};
}

size_t ResultCache::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_expired_locked(std::chrono::steady_clock::now());
    return entries_.size();
}

void ResultCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

void ResultCache::purge_expired_locked(std::chrono::steady_clock::time_point now) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now - it->second.inserted_at >= ttl_) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace mockrun
