#include "code_executor.h"
#include "code_validator.h"
#include "light_sandbox.h"
#include "harness.h"
#include "json_utils.h"
#include "errors.h"
#include <regex>
#include <iostream>
#include <algorithm>

namespace mockrun {

namespace {

// Destroys a Heavy environment on every exit path
class EnvironmentGuard {
public:
    EnvironmentGuard(EnvironmentManager& environments, const EnvironmentHandle& handle)
        : environments_(environments), handle_(handle) {}

    ~EnvironmentGuard() {
        try {
            environments_.destroy(handle_);
        } catch (const std::exception& e) {
            std::cerr << "[Executor] Failed to destroy " << handle_.id << ": " << e.what() << std::endl;
        }
    }

    EnvironmentGuard(const EnvironmentGuard&) = delete;
    EnvironmentGuard& operator=(const EnvironmentGuard&) = delete;

private:
    EnvironmentManager& environments_;
    EnvironmentHandle handle_;
};

std::chrono::milliseconds run_deadline(const ExecutionRequest& request) {
    return std::min(request.timeout, std::chrono::milliseconds(MAX_RUN_DEADLINE_MS));
}

std::string last_line(const std::string& text) {
    size_t end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) {
        return "";
    }
    size_t start = text.rfind('\n', end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return text.substr(start, end - start + 1);
}

} // namespace

CodeExecutor::CodeExecutor(EnvironmentManager& environments, const Config& config)
    : environments_(environments), config_(config), cache_(config.cache_ttl) {}

void CodeExecutor::validate(const std::string& code, const std::string& language) const {
    CodeValidator::validate(code, language);
}

bool CodeExecutor::uses_async(const std::string& code) {
    static const std::regex async_pattern("\\b(async|await|Promise)\\b|\\.then\\s*\\(");
    return std::regex_search(code, async_pattern);
}

StrategyDecision CodeExecutor::select_strategy(const std::string& code, const StrategyOptions& options) {
    bool non_default_language = options.language != LANGUAGE_JAVASCRIPT;

    std::string wanted;
    if (non_default_language) {
        wanted = "language '" + options.language + "' runs on the node runtime";
    } else if (options.require_isolation) {
        wanted = "isolation requested";
    } else if (uses_async(code)) {
        wanted = "asynchronous constructs";
    }

    if (wanted.empty()) {
        return StrategyDecision{Strategy::LIGHT, false, "default"};
    }

    EnvironmentHealth health = environments_.health_check();
    if (health.healthy) {
        return StrategyDecision{Strategy::HEAVY, false, wanted};
    }

    if (non_default_language) {
        throw IsolationUnavailable("Language '" + options.language +
                                   "' needs the heavy backend, which is unavailable: " + health.reason);
    }
    if (config_.strict_isolation) {
        throw IsolationUnavailable("Heavy isolation required (" + wanted +
                                   ") but unavailable: " + health.reason);
    }

    std::cout << "[Executor] Downgrading to light strategy (" << wanted << "): "
              << health.reason << std::endl;
    return StrategyDecision{Strategy::LIGHT, true, wanted + "; heavy backend unavailable: " + health.reason};
}

ExecutionResult CodeExecutor::execute(const StrategyDecision& decision, const ExecutionContext& context) {
    std::string key = ResultCache::compute_key(context, decision.strategy);
    if (auto hit = cache_.get(key)) {
        std::cout << "[Executor] Cache hit for " << context.request.execution_id << std::endl;
        // The stored entry may come from a request that did not need isolation
        hit->downgraded = decision.downgraded;
        return *hit;
    }

    ExecutionResult result = decision.strategy == Strategy::HEAVY
        ? run_heavy(context)
        : run_light(context);
    result.downgraded = decision.downgraded;

    extract_save_directive(result);
    cache_.put(key, result);

    std::cout << "[Executor] " << context.request.execution_id << " finished ("
              << strategy_to_string(result.strategy) << ", "
              << (result.success ? "success" : "error") << ", "
              << result.execution_time.count() << "ms)" << std::endl;
    return result;
}

ExecutionResult CodeExecutor::run_light(const ExecutionContext& context) {
    LightSandboxConfig config;
    config.memory_limit_bytes = context.request.memory_limit_mb * 1024 * 1024;
    config.timeout = run_deadline(context.request);

    LightSandbox sandbox(config);
    return sandbox.run(context);
}

ExecutionResult CodeExecutor::run_heavy(const ExecutionContext& context) {
    EnvironmentHandle handle = environments_.create(LANGUAGE_NODE, context.request.memory_limit_mb);
    EnvironmentGuard guard(environments_, handle);

    RunOutput run = environments_.run(handle, Harness::build_node_program(context),
                                      run_deadline(context.request));

    ExecutionResult result;
    result.strategy = Strategy::HEAVY;
    result.environment_id = handle.id;
    result.execution_time = run.wall_time;

    const Json::Value& envelope = run.output;
    if (run.structured && envelope.isObject() && envelope.isMember(ENVELOPE_MARKER)) {
        result.success = envelope["success"].asBool();
        result.output = envelope["data"];
        if (envelope["error"].isString()) {
            result.error = envelope["error"].asString();
        }
        for (const auto& line : envelope["logs"]) {
            result.logs.push_back(line.isString() ? line.asString() : JsonUtils::to_compact(line));
        }
    } else if (run.exit_code != 0) {
        result.success = false;
        result.error = last_line(run.stderr_output);
        if (result.error.empty()) {
            result.error = "Process exited with code " + std::to_string(run.exit_code);
        }
    } else {
        // The harness prints its envelope once the handler settles
        result.success = false;
        result.error = "Returned promise never settled";
    }

    return result;
}

void CodeExecutor::extract_save_directive(ExecutionResult& result) {
    if (!result.success || !result.output.isObject()) {
        return;
    }

    Json::Value* holder = nullptr;
    if (result.output.isMember(SAVE_OPERATION_KEY)) {
        holder = &result.output;
    } else if (result.output.isMember("data") && result.output["data"].isObject() &&
               result.output["data"].isMember(SAVE_OPERATION_KEY)) {
        holder = &result.output["data"];
    }
    if (!holder) {
        return;
    }

    result.save_directive = SaveDirective::from_json((*holder)[SAVE_OPERATION_KEY]);
    holder->removeMember(SAVE_OPERATION_KEY);
}

CodeExecutor::Stats CodeExecutor::get_stats() {
    EnvironmentHealth health = environments_.health_check();
    Stats stats;
    stats.cache_size = cache_.size();
    stats.cache_ttl = cache_.ttl();
    stats.heavy_healthy = health.healthy;
    stats.heavy_reason = health.reason;
    return stats;
}

} // namespace mockrun
