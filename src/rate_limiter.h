#pragma once

#include <string>
#include <map>
#include <deque>
#include <mutex>
#include <chrono>
#include "constants.h"

namespace mockrun {

// Per-user sliding-window execution limiter
class RateLimiter {
public:
    struct Config {
        int max_executions_per_window;
        std::chrono::seconds window;
        int cleanup_after_minutes;

        Config() :
            max_executions_per_window(MAX_EXECUTIONS_PER_HOUR),
            window(std::chrono::hours(1)),
            cleanup_after_minutes(RATE_LIMIT_CLEANUP_MINUTES) {}
    };

    struct QuotaInfo {
        int executions_in_window = 0;
        int limit = 0;
        bool can_execute = false;
        std::chrono::seconds retry_after{0};
        std::string reason;
    };

    explicit RateLimiter(const Config& config = Config());

    // Current standing, records nothing
    QuotaInfo check_quota(const std::string& user_id);

    // Records one execution. Throws RateLimitExceeded when the window is full.
    void acquire(const std::string& user_id);

    // Forget users idle for longer than cleanup_after_minutes
    void cleanup_old_entries();

    size_t tracked_users() const;
    int limit() const { return config_.max_executions_per_window; }

private:
    struct UserState {
        std::deque<std::chrono::steady_clock::time_point> executions;
        std::chrono::steady_clock::time_point last_seen;
    };

    QuotaInfo quota_locked(UserState& state, std::chrono::steady_clock::time_point now);

    Config config_;
    mutable std::mutex mutex_;
    std::map<std::string, UserState> users_;
};

} // namespace mockrun
