#include "rate_limiter.h"
#include "errors.h"
#include <iostream>
#include <algorithm>

namespace mockrun {

RateLimiter::RateLimiter(const Config& config) : config_(config) {}

RateLimiter::QuotaInfo RateLimiter::quota_locked(UserState& state,
                                                 std::chrono::steady_clock::time_point now) {
    // Drop executions that slid out of the window
    auto window_start = now - config_.window;
    while (!state.executions.empty() && state.executions.front() <= window_start) {
        state.executions.pop_front();
    }

    QuotaInfo info;
    info.limit = config_.max_executions_per_window;
    info.executions_in_window = static_cast<int>(state.executions.size());
    info.can_execute = info.executions_in_window < info.limit;

    if (!info.can_execute) {
        auto oldest = state.executions.empty() ? now : state.executions.front();
        auto retry = std::chrono::duration_cast<std::chrono::seconds>(oldest + config_.window - now);
        info.retry_after = std::max(retry + std::chrono::seconds(1), std::chrono::seconds(1));
        info.reason = "Execution limit of " + std::to_string(info.limit) + " per " +
                      std::to_string(config_.window.count()) + "s reached";
    }
    return info;
}

RateLimiter::QuotaInfo RateLimiter::check_quota(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) {
        QuotaInfo info;
        info.limit = config_.max_executions_per_window;
        info.can_execute = info.limit > 0;
        return info;
    }
    return quota_locked(it->second, std::chrono::steady_clock::now());
}

void RateLimiter::acquire(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();

    UserState& state = users_[user_id];
    state.last_seen = now;

    QuotaInfo info = quota_locked(state, now);
    if (!info.can_execute) {
        std::cerr << "[Orchestrator] Rate limit hit for user " << user_id << std::endl;
        throw RateLimitExceeded(info.reason, info.retry_after);
    }

    state.executions.push_back(now);
}

void RateLimiter::cleanup_old_entries() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cutoff = std::chrono::steady_clock::now() - std::chrono::minutes(config_.cleanup_after_minutes);

    for (auto it = users_.begin(); it != users_.end();) {
        if (it->second.last_seen < cutoff) {
            it = users_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t RateLimiter::tracked_users() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return users_.size();
}

} // namespace mockrun
