#include "environment_manager.h"
#include "sandbox.h"
#include "errors.h"
#include "hash_utils.h"
#include "json_utils.h"
#include <filesystem>
#include <iostream>
#include <fstream>
#include <cstdlib>
#include <cstring>
#include <signal.h>

namespace fs = std::filesystem;

namespace mockrun {

std::string environment_state_to_string(EnvironmentState state) {
    switch (state) {
        case EnvironmentState::CREATED: return "CREATED";
        case EnvironmentState::RUNNING: return "RUNNING";
        case EnvironmentState::DESTROYED: return "DESTROYED";
    }
    return "UNKNOWN";
}

EnvironmentManager::EnvironmentManager() : EnvironmentManager(Config()) {}

EnvironmentManager::EnvironmentManager(const Config& config) : config_(config) {
    std::error_code ec;
    fs::create_directories(config_.base_dir, ec);
    if (ec) {
        std::cerr << "[EnvManager] Cannot create base directory " << config_.base_dir
                  << ": " << ec.message() << std::endl;
    }

    RuntimeProfile node;
    node.name = "node";
    node.executable = config_.node_binary;
    node.program_file = "main.js";
    node.heap_flag_prefix = "--max-old-space-size=";
    node.extra_args = {"--disallow-code-generation-from-strings"};
    register_profile(node);

    std::cout << "[EnvManager] Initialized (max " << config_.max_environments
              << " environments, base " << config_.base_dir << ")" << std::endl;
}

EnvironmentManager::~EnvironmentManager() {
    stop_sweeper();

    std::unique_lock<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, _] : environments_) {
        ids.push_back(id);
    }
    for (const auto& id : ids) {
        destroy_locked(lock, id);
    }
}

void EnvironmentManager::register_profile(const RuntimeProfile& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    profiles_[profile.name] = profile;
}

bool EnvironmentManager::has_profile(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return profiles_.count(kind) > 0;
}

EnvironmentHandle EnvironmentManager::create(const std::string& kind, size_t memory_limit_mb) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (profiles_.count(kind) == 0) {
        throw InternalError("Unknown environment kind: " + kind);
    }

    if (environments_.size() >= config_.max_environments) {
        std::cerr << "[EnvManager] Ceiling reached (" << environments_.size() << "/"
                  << config_.max_environments << ")" << std::endl;
        throw ResourceExhausted("Maximum concurrent environments reached (" +
                                std::to_string(config_.max_environments) + ")");
    }

    std::string dir_template = config_.base_dir + "/env_XXXXXX";
    std::vector<char> buf(dir_template.begin(), dir_template.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data())) {
        throw InternalError("mkdtemp failed: " + std::string(std::strerror(errno)));
    }

    IsolatedEnvironment env;
    env.id = "env_" + HashUtils::random_hex(8);
    env.kind = kind;
    env.created_at = std::chrono::steady_clock::now();
    env.last_used = env.created_at;
    env.memory_limit_mb = memory_limit_mb;
    env.working_directory = buf.data();

    environments_[env.id] = env;
    ++created_total_;

    std::cout << "[EnvManager] Created " << env.id << " (" << kind << ", "
              << memory_limit_mb << "MB)" << std::endl;

    return EnvironmentHandle{env.id, kind};
}

RunOutput EnvironmentManager::run(const EnvironmentHandle& handle, const std::string& program,
                                  std::chrono::milliseconds timeout) {
    RuntimeProfile profile;
    std::string working_directory;
    size_t memory_limit_mb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = environments_.find(handle.id);
        if (it == environments_.end() || it->second.state == EnvironmentState::DESTROYED) {
            throw InternalError("Environment not available: " + handle.id);
        }
        if (it->second.state == EnvironmentState::RUNNING) {
            throw InternalError("Environment already running: " + handle.id);
        }
        it->second.state = EnvironmentState::RUNNING;
        it->second.last_used = std::chrono::steady_clock::now();
        profile = profiles_.at(it->second.kind);
        working_directory = it->second.working_directory;
        memory_limit_mb = it->second.memory_limit_mb;
    }

    auto deadline = std::min(timeout, std::chrono::milliseconds(MAX_RUN_DEADLINE_MS));

    // Returns the environment to CREATED (or leaves it gone) whatever happens below
    auto finish = [&]() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = environments_.find(handle.id);
        if (it != environments_.end()) {
            it->second.pid = 0;
            if (it->second.state == EnvironmentState::RUNNING) {
                it->second.state = EnvironmentState::CREATED;
            }
            it->second.last_used = std::chrono::steady_clock::now();
        }
        reaped_cv_.notify_all();
    };

    ProcessResult result;
    try {
        std::string program_path = working_directory + "/" + profile.program_file;
        std::ofstream out(program_path);
        out << program;
        out.close();
        if (!out) {
            throw InternalError("Failed to write program to " + program_path);
        }

        SandboxConfig sandbox_config;
        sandbox_config.working_directory = working_directory;
        sandbox_config.memory_limit_bytes = memory_limit_mb * 1024 * 1024;
        sandbox_config.timeout = deadline;
        sandbox_config.limit_address_space = profile.limit_address_space;

        std::vector<std::string> argv{profile.executable};
        if (!profile.heap_flag_prefix.empty()) {
            argv.push_back(profile.heap_flag_prefix + std::to_string(memory_limit_mb));
        }
        argv.insert(argv.end(), profile.extra_args.begin(), profile.extra_args.end());
        argv.push_back(profile.program_file);

        Sandbox sandbox(sandbox_config);
        result = sandbox.run(argv, [this, &handle](pid_t pid) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = environments_.find(handle.id);
            if (it != environments_.end()) {
                it->second.pid = pid;
            }
        });
    } catch (...) {
        finish();
        throw;
    }
    finish();

    if (result.timeout_occurred) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++timed_out_total_;
        }
        std::cerr << "[EnvManager] " << handle.id << " exceeded " << deadline.count()
                  << "ms, destroying" << std::endl;
        destroy(handle);
        throw ExecutionTimeout("Execution exceeded " + std::to_string(deadline.count()) + "ms");
    }

    if (state(handle) == EnvironmentState::DESTROYED) {
        throw InternalError("Environment " + handle.id + " was destroyed during the run");
    }

    if (result.exit_code == ISOLATION_FAILURE_EXIT_CODE &&
        result.stderr_output.find("isolation setup failed") != std::string::npos) {
        std::cerr << "[EnvManager] " << result.stderr_output;
        throw IsolationUnavailable(result.stderr_output);
    }

    RunOutput output;
    output.exit_code = result.exit_code;
    output.stderr_output = result.stderr_output;
    output.wall_time = result.wall_time;

    auto parsed = JsonUtils::find_last_json_value(result.stdout_output);
    if (parsed) {
        output.output = *parsed;
        output.structured = true;
    } else {
        output.output = Json::Value(result.stdout_output);
    }
    return output;
}

void EnvironmentManager::destroy(const EnvironmentHandle& handle) {
    std::unique_lock<std::mutex> lock(mutex_);
    destroy_locked(lock, handle.id);
}

void EnvironmentManager::destroy_locked(std::unique_lock<std::mutex>& lock, const std::string& id) {
    auto it = environments_.find(id);
    if (it == environments_.end() || it->second.state == EnvironmentState::DESTROYED) {
        return;
    }

    IsolatedEnvironment& env = it->second;
    env.state = EnvironmentState::DESTROYED;

    // The run() thread owns reaping; wait for it to observe the exit
    if (env.pid > 0) {
        pid_t pid = env.pid;
        kill(-pid, SIGTERM);
        kill(pid, SIGTERM);

        auto grace = std::chrono::milliseconds(DESTROY_GRACE_PERIOD_MS);
        if (!reaped_cv_.wait_for(lock, grace, [&env]() { return env.pid == 0; })) {
            std::cerr << "[EnvManager] " << id << " ignored SIGTERM, killing" << std::endl;
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            reaped_cv_.wait_for(lock, grace, [&env]() { return env.pid == 0; });
        }
    }

    std::string working_directory = env.working_directory;
    environments_.erase(it);
    ++destroyed_total_;

    std::error_code ec;
    fs::remove_all(working_directory, ec);
    if (ec) {
        std::cerr << "[EnvManager] Failed to remove " << working_directory << ": "
                  << ec.message() << std::endl;
    }

    std::cout << "[EnvManager] Destroyed " << id << std::endl;
}

std::string EnvironmentManager::probe_reason() {
    std::lock_guard<std::mutex> lock(probe_mutex_);
    auto now = std::chrono::steady_clock::now();
    if (!probed_ || now - probed_at_ > std::chrono::seconds(HEALTH_PROBE_INTERVAL_SECONDS)) {
        probe_failure_ = Sandbox::probe_isolation();
        probed_ = true;
        probed_at_ = now;
        if (!probe_failure_.empty()) {
            std::cerr << "[EnvManager] Isolation probe failed: " << probe_failure_ << std::endl;
        }
    }
    return probe_failure_;
}

EnvironmentHealth EnvironmentManager::health_check() {
    EnvironmentHealth health;
    health.max_environments = config_.max_environments;
    health.active = active_count();

    if (!config_.heavy_enabled) {
        health.reason = "heavy backend disabled by configuration";
        return health;
    }

    if (Sandbox::find_executable(config_.node_binary).empty()) {
        health.reason = "runtime binary not found: " + config_.node_binary;
        return health;
    }

    health.reason = probe_reason();
    health.healthy = health.reason.empty();
    return health;
}

size_t EnvironmentManager::sweep(std::chrono::seconds max_age) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto cutoff = std::chrono::steady_clock::now() - max_age;

    std::vector<std::string> stale;
    for (const auto& [id, env] : environments_) {
        if (env.last_used < cutoff) {
            stale.push_back(id);
        }
    }

    for (const auto& id : stale) {
        std::cout << "[EnvManager] Sweeping idle environment " << id << std::endl;
        destroy_locked(lock, id);
    }
    return stale.size();
}

void EnvironmentManager::start_sweeper(std::chrono::seconds interval, std::chrono::seconds max_age) {
    stop_sweeper();
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        sweeper_stop_ = false;
    }

    sweeper_ = std::thread([this, interval, max_age]() {
        std::unique_lock<std::mutex> lock(sweeper_mutex_);
        while (!sweeper_cv_.wait_for(lock, interval, [this]() { return sweeper_stop_; })) {
            lock.unlock();
            size_t swept = sweep(max_age);
            if (swept > 0) {
                std::cout << "[EnvManager] Sweeper reclaimed " << swept << " environments" << std::endl;
            }
            lock.lock();
        }
    });
}

void EnvironmentManager::stop_sweeper() {
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        sweeper_stop_ = true;
    }
    sweeper_cv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
    }
}

EnvironmentState EnvironmentManager::state(const EnvironmentHandle& handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = environments_.find(handle.id);
    if (it == environments_.end()) {
        return EnvironmentState::DESTROYED;
    }
    return it->second.state;
}

size_t EnvironmentManager::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return environments_.size();
}

EnvironmentManager::Stats EnvironmentManager::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats stats;
    stats.active = environments_.size();
    stats.created = created_total_;
    stats.destroyed = destroyed_total_;
    stats.timed_out = timed_out_total_;
    return stats;
}

} // namespace mockrun
