#pragma once

#include <string>
#include <map>
#include <mutex>
#include <chrono>
#include <optional>
#include "constants.h"
#include "execution_types.h"

namespace mockrun {

// Expiring map from content hash to result snapshot, guarded by one mutex
class ResultCache {
public:
    explicit ResultCache(std::chrono::milliseconds ttl = std::chrono::milliseconds(CACHE_TTL_MS));

    // SHA-256 over code, language, strategy, mock data, environment and request.
    // The execution id is not part of the key.
    static std::string compute_key(const ExecutionContext& context, Strategy strategy);

    // Copy of a live entry, flagged as cached
    std::optional<ExecutionResult> get(const std::string& key);

    // Unsuccessful results are ignored
    void put(const std::string& key, const ExecutionResult& result);

    size_t size();
    void clear();
    std::chrono::milliseconds ttl() const { return ttl_; }

private:
    struct Entry {
        ExecutionResult result;
        std::chrono::steady_clock::time_point inserted_at;
    };

    void purge_expired_locked(std::chrono::steady_clock::time_point now);

    std::chrono::milliseconds ttl_;
    std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

} // namespace mockrun
