#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <memory>
#include <functional>
#include <sys/types.h>
#include "constants.h"

namespace mockrun {

// Process-level isolation for one program run
struct SandboxConfig {
    std::string working_directory;
    size_t memory_limit_bytes = DEFAULT_MEMORY_LIMIT_MB * 1024 * 1024;
    std::chrono::milliseconds timeout{DEFAULT_TIMEOUT_MS};
    bool allow_network = false;                      // Airgapped by default
    bool read_only_root = true;                      // Remount every mount read-only
    bool limit_address_space = false;                // RLIMIT_AS; off for V8, which reserves large VM
    std::vector<std::string> environment;            // KEY=VALUE, replaces the parent environment
};

struct ProcessResult {
    int exit_code = 0;
    std::string stdout_output;
    std::string stderr_output;
    std::chrono::milliseconds wall_time{0};
    bool timeout_occurred = false;
    bool output_truncated = false;
    int term_signal = 0;                             // Non-zero when killed by a signal
};

// Exit status used by the child when it cannot build its isolation
constexpr int ISOLATION_FAILURE_EXIT_CODE = 126;

// Runs a command inside fresh user, mount, network, IPC and UTS namespaces with
// rlimits and a seccomp filter. The wall-clock deadline kills the whole process group.
class Sandbox {
public:
    explicit Sandbox(const SandboxConfig& config);
    ~Sandbox();

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    // argv[0] is resolved against PATH before forking.
    // on_started receives the child pid once it exists (used for external termination).
    ProcessResult run(const std::vector<std::string>& argv,
                      const std::function<void(pid_t)>& on_started = nullptr);

    // Builds the same isolation in a throwaway child. Empty string means it works,
    // otherwise the reason it does not.
    static std::string probe_isolation();

    // Absolute path of an executable found on PATH, or empty
    static std::string find_executable(const std::string& name);

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace mockrun
