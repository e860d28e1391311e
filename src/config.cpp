#include "config.h"
#include "errors.h"
#include <cstdlib>
#include <sstream>
#include <algorithm>

namespace mockrun {

namespace {

int parse_int(const std::string& name, const std::string& value, int min, int max) {
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != value.size() || parsed < min || parsed > max) {
        throw ValidationError("Invalid value for " + name + ": '" + value + "' (expected " +
                              std::to_string(min) + ".." + std::to_string(max) + ")",
                              "INVALID_CONFIG");
    }
    return parsed;
}

bool parse_bool(const std::string& name, std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    throw ValidationError("Invalid value for " + name + ": '" + value + "' (expected true/false)",
                          "INVALID_CONFIG");
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // namespace

void ServiceConfig::apply_environment() {
    if (const char* v = env("MOCKRUN_MAX_ENVIRONMENTS")) {
        max_environments = static_cast<size_t>(parse_int("MOCKRUN_MAX_ENVIRONMENTS", v, 1, 1000));
    }
    if (const char* v = env("MOCKRUN_RATE_LIMIT_PER_HOUR")) {
        rate_limit_per_hour = parse_int("MOCKRUN_RATE_LIMIT_PER_HOUR", v, 1, 1000000);
    }
    if (const char* v = env("MOCKRUN_STRICT_ISOLATION")) {
        strict_isolation = parse_bool("MOCKRUN_STRICT_ISOLATION", v);
    }
    if (const char* v = env("MOCKRUN_HEAVY_ENABLED")) {
        heavy_enabled = parse_bool("MOCKRUN_HEAVY_ENABLED", v);
    }
    if (const char* v = env("MOCKRUN_NODE_BINARY")) {
        node_binary = v;
    }
    if (const char* v = env("MOCKRUN_WORK_DIR")) {
        work_dir = v;
    }
    if (const char* v = env("MOCKRUN_CACHE_TTL_MS")) {
        cache_ttl_ms = parse_int("MOCKRUN_CACHE_TTL_MS", v, 0, 3600000);
    }
}

void ServiceConfig::apply_args(const std::vector<std::string>& args) {
    auto value_of = [&args](size_t& i) -> const std::string& {
        if (i + 1 >= args.size()) {
            throw ValidationError("Missing value for " + args[i], "INVALID_CONFIG");
        }
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--port") {
            port = parse_int(arg, value_of(i), 1, 65535);
        } else if (arg == "--data") {
            data_file = value_of(i);
        } else if (arg == "--max-environments") {
            max_environments = static_cast<size_t>(parse_int(arg, value_of(i), 1, 1000));
        } else if (arg == "--rate-limit") {
            rate_limit_per_hour = parse_int(arg, value_of(i), 1, 1000000);
        } else if (arg == "--strict-isolation") {
            strict_isolation = true;
        } else if (arg == "--no-heavy") {
            heavy_enabled = false;
        } else if (arg == "--node") {
            node_binary = value_of(i);
        } else if (arg == "--work-dir") {
            work_dir = value_of(i);
        } else if (arg == "--help" || arg == "-h") {
            show_help = true;
        } else {
            throw ValidationError("Unknown option: " + arg, "INVALID_CONFIG");
        }
    }
}

ServiceConfig ServiceConfig::load(int argc, char* argv[]) {
    ServiceConfig config;
    config.apply_environment();
    config.apply_args(std::vector<std::string>(argv + 1, argv + argc));
    return config;
}

std::string ServiceConfig::usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [OPTIONS]\n\n"
        << "Options:\n"
        << "  --port <port>             HTTP port (default: " << DEFAULT_PORT << ")\n"
        << "  --data <fixture.json>     Load projects, endpoints and collections\n"
        << "  --max-environments <n>    Concurrent isolated environments (default: "
        << DEFAULT_MAX_ENVIRONMENTS << ")\n"
        << "  --rate-limit <n>          Executions per user per hour (default: "
        << MAX_EXECUTIONS_PER_HOUR << ")\n"
        << "  --strict-isolation        Fail instead of downgrading to the light strategy\n"
        << "  --no-heavy                Disable the isolated process backend\n"
        << "  --node <path>             Node binary (default: node)\n"
        << "  --work-dir <dir>          Environment working directories (default: /tmp/mockrun_envs)\n"
        << "  --help                    Show this help message\n\n"
        << "Environment: MOCKRUN_MAX_ENVIRONMENTS, MOCKRUN_RATE_LIMIT_PER_HOUR, MOCKRUN_STRICT_ISOLATION,\n"
        << "             MOCKRUN_HEAVY_ENABLED, MOCKRUN_NODE_BINARY, MOCKRUN_WORK_DIR, MOCKRUN_CACHE_TTL_MS\n";
    return out.str();
}

EnvironmentManager::Config ServiceConfig::environment_config() const {
    EnvironmentManager::Config config;
    config.max_environments = max_environments;
    config.base_dir = work_dir;
    config.node_binary = node_binary;
    config.heavy_enabled = heavy_enabled;
    return config;
}

CodeExecutor::Config ServiceConfig::executor_config() const {
    CodeExecutor::Config config;
    config.strict_isolation = strict_isolation;
    config.cache_ttl = std::chrono::milliseconds(cache_ttl_ms);
    return config;
}

RateLimiter::Config ServiceConfig::rate_limit_config() const {
    RateLimiter::Config config;
    config.max_executions_per_window = rate_limit_per_hour;
    return config;
}

} // namespace mockrun
