#pragma once

#include <string>
#include <map>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <chrono>
#include <sys/types.h>
#include <json/json.h>
#include "constants.h"

namespace mockrun {

enum class EnvironmentState {
    CREATED,
    RUNNING,
    DESTROYED
};

std::string environment_state_to_string(EnvironmentState state);

// How a runtime is launched inside an environment
struct RuntimeProfile {
    std::string name;                      // e.g., "node"
    std::string executable;                // Resolved on PATH when not absolute
    std::string program_file;              // Written into the working directory
    std::string heap_flag_prefix;          // Memory ceiling passed to the runtime, empty for none
    std::vector<std::string> extra_args;
    bool limit_address_space = false;      // RLIMIT_AS in addition to the heap flag
};

// One disposable isolated environment. Owned by the manager's registry.
struct IsolatedEnvironment {
    std::string id;
    std::string kind;
    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point last_used;
    size_t memory_limit_mb = DEFAULT_MEMORY_LIMIT_MB;
    EnvironmentState state = EnvironmentState::CREATED;
    std::string working_directory;
    pid_t pid = 0;                         // Running child, 0 when idle
};

struct EnvironmentHandle {
    std::string id;
    std::string kind;
};

// Output of one run inside an environment
struct RunOutput {
    Json::Value output;                    // Last JSON value in stdout, or stdout as a string
    bool structured = false;               // output was parsed from JSON
    int exit_code = 0;
    std::string stderr_output;
    std::chrono::milliseconds wall_time{0};
};

struct EnvironmentHealth {
    bool healthy = false;
    std::string reason;                    // Set when unhealthy
    size_t active = 0;
    size_t max_environments = 0;
};

// Environment manager - creates, runs code inside, and destroys isolated environments
class EnvironmentManager {
public:
    struct Config {
        size_t max_environments = DEFAULT_MAX_ENVIRONMENTS;
        std::string base_dir = "/tmp/mockrun_envs";
        std::string node_binary = "node";
        bool heavy_enabled = true;
    };

    EnvironmentManager();
    explicit EnvironmentManager(const Config& config);
    ~EnvironmentManager();

    EnvironmentManager(const EnvironmentManager&) = delete;
    EnvironmentManager& operator=(const EnvironmentManager&) = delete;

    void register_profile(const RuntimeProfile& profile);
    bool has_profile(const std::string& kind) const;

    // Throws ResourceExhausted at the ceiling
    EnvironmentHandle create(const std::string& kind,
                             size_t memory_limit_mb = DEFAULT_MEMORY_LIMIT_MB);

    // Writes the program and runs it under the deadline (capped at MAX_RUN_DEADLINE_MS).
    // On expiry the environment is destroyed and ExecutionTimeout is thrown.
    RunOutput run(const EnvironmentHandle& handle, const std::string& program,
                  std::chrono::milliseconds timeout);

    // Idempotent
    void destroy(const EnvironmentHandle& handle);

    EnvironmentHealth health_check();

    // Destroys environments idle for longer than max_age. Returns how many.
    size_t sweep(std::chrono::seconds max_age);

    void start_sweeper(std::chrono::seconds interval = std::chrono::seconds(SWEEP_INTERVAL_SECONDS),
                       std::chrono::seconds max_age = std::chrono::seconds(SWEEP_MAX_AGE_SECONDS));
    void stop_sweeper();

    // DESTROYED for unknown handles
    EnvironmentState state(const EnvironmentHandle& handle) const;
    size_t active_count() const;
    size_t max_environments() const { return config_.max_environments; }

    struct Stats {
        size_t active;
        size_t created;
        size_t destroyed;
        size_t timed_out;
    };
    Stats get_stats() const;

private:
    void destroy_locked(std::unique_lock<std::mutex>& lock, const std::string& id);
    std::string probe_reason();

    Config config_;
    mutable std::mutex mutex_;
    std::condition_variable reaped_cv_;
    std::map<std::string, IsolatedEnvironment> environments_;
    std::map<std::string, RuntimeProfile> profiles_;

    size_t created_total_ = 0;
    size_t destroyed_total_ = 0;
    size_t timed_out_total_ = 0;

    // Cached isolation probe
    std::mutex probe_mutex_;
    bool probed_ = false;
    std::string probe_failure_;
    std::chrono::steady_clock::time_point probed_at_;

    std::thread sweeper_;
    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    bool sweeper_stop_ = false;
};

} // namespace mockrun
