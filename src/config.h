#pragma once

#include <string>
#include <vector>
#include "constants.h"
#include "environment_manager.h"
#include "code_executor.h"
#include "rate_limiter.h"

namespace mockrun {

// Service settings: constants.h defaults, then MOCKRUN_* environment variables,
// then command-line flags. Bad values throw ValidationError (INVALID_CONFIG).
struct ServiceConfig {
    int port = DEFAULT_PORT;
    std::string data_file;                         // Fixture for the in-memory store
    size_t max_environments = DEFAULT_MAX_ENVIRONMENTS;
    int rate_limit_per_hour = MAX_EXECUTIONS_PER_HOUR;
    bool strict_isolation = false;
    bool heavy_enabled = true;
    std::string node_binary = "node";
    std::string work_dir = "/tmp/mockrun_envs";
    int cache_ttl_ms = CACHE_TTL_MS;
    bool show_help = false;

    void apply_environment();
    void apply_args(const std::vector<std::string>& args);

    static ServiceConfig load(int argc, char* argv[]);
    static std::string usage(const std::string& program);

    EnvironmentManager::Config environment_config() const;
    CodeExecutor::Config executor_config() const;
    RateLimiter::Config rate_limit_config() const;
};

} // namespace mockrun
