#pragma once

#include <string>
#include <chrono>
#include "constants.h"
#include "execution_types.h"
#include "environment_manager.h"
#include "result_cache.h"

namespace mockrun {

struct StrategyOptions {
    std::string language = "javascript";
    bool require_isolation = false;
};

struct StrategyDecision {
    Strategy strategy = Strategy::LIGHT;
    bool downgraded = false;
    std::string reason;
};

// Validates code, picks an isolation strategy and runs it, caching successes
class CodeExecutor {
public:
    struct Config {
        bool strict_isolation = false;                 // Refuse to downgrade Heavy to Light
        std::chrono::milliseconds cache_ttl{CACHE_TTL_MS};
    };

    CodeExecutor(EnvironmentManager& environments, const Config& config);

    // Throws ValidationError; allocates nothing
    void validate(const std::string& code, const std::string& language) const;

    // Light by default. Heavy for async code, a non-default language or an explicit
    // isolation request. Throws IsolationUnavailable when Heavy is needed, unhealthy,
    // and a downgrade is not allowed.
    StrategyDecision select_strategy(const std::string& code, const StrategyOptions& options);

    // Runtime errors come back as success=false; ExecutionTimeout and the
    // environment errors propagate.
    ExecutionResult execute(const StrategyDecision& decision, const ExecutionContext& context);

    // async, await, Promise, .then(
    static bool uses_async(const std::string& code);

    // Moves a sandbox-reported save directive (top level, or under data) out of the output
    static void extract_save_directive(ExecutionResult& result);

    struct Stats {
        size_t cache_size;
        std::chrono::milliseconds cache_ttl;
        bool heavy_healthy;
        std::string heavy_reason;
    };
    Stats get_stats();

    ResultCache& cache() { return cache_; }

private:
    ExecutionResult run_light(const ExecutionContext& context);
    ExecutionResult run_heavy(const ExecutionContext& context);

    EnvironmentManager& environments_;
    Config config_;
    ResultCache cache_;
};

} // namespace mockrun
