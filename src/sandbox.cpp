#include "sandbox.h"
#include "errors.h"
#include <sys/wait.h>
#include <sys/resource.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/statvfs.h>
#include <sys/socket.h>
#include <sys/mman.h>
#include <unistd.h>
#include <sched.h>
#include <signal.h>
#include <seccomp.h>
#include <fcntl.h>
#include <poll.h>
#include <mntent.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <sstream>
#include <algorithm>

namespace mockrun {

namespace {

// Everything the child needs, prepared before fork(): after fork() in a
// multithreaded process only async-signal-safe calls are allowed until execve().
struct ChildPlan {
    std::string executable;
    std::vector<std::string> argv_storage;
    std::vector<std::string> env_storage;
    std::vector<char*> argv;
    std::vector<char*> envp;
    std::string working_directory;
    std::string uid_map;
    std::string gid_map;
    std::vector<std::string> mount_points;
    std::vector<sock_filter> seccomp_program;
    rlim_t cpu_seconds = 0;
    rlim_t address_space_bytes = 0;              // 0 = unlimited
    bool allow_network = false;
    bool read_only_root = true;
    bool probe_only = false;                     // Build isolation then exit(0)
};

void append_raw(char* buf, size_t cap, size_t& len, const char* text) {
    while (*text && len + 1 < cap) {
        buf[len++] = *text++;
    }
}

void append_number(char* buf, size_t cap, size_t& len, int value) {
    char digits[16];
    int n = 0;
    unsigned int v = value < 0 ? static_cast<unsigned int>(-value) : static_cast<unsigned int>(value);
    do {
        digits[n++] = static_cast<char>('0' + v % 10);
        v /= 10;
    } while (v && n < 15);
    if (value < 0 && len + 1 < cap) buf[len++] = '-';
    while (n > 0 && len + 1 < cap) {
        buf[len++] = digits[--n];
    }
}

[[noreturn]] void child_fail(int err_fd, const char* step) {
    int saved_errno = errno;
    char buf[192];
    size_t len = 0;
    append_raw(buf, sizeof(buf), len, "mockrun: isolation setup failed at ");
    append_raw(buf, sizeof(buf), len, step);
    append_raw(buf, sizeof(buf), len, " (errno ");
    append_number(buf, sizeof(buf), len, saved_errno);
    append_raw(buf, sizeof(buf), len, ")\n");
    ssize_t ignored = write(err_fd, buf, len);
    (void)ignored;
    _exit(ISOLATION_FAILURE_EXIT_CODE);
}

bool write_proc_file(const char* path, const std::string& content) {
    int fd = open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    ssize_t written = write(fd, content.data(), content.size());
    close(fd);
    return written == static_cast<ssize_t>(content.size());
}

unsigned long preserved_mount_flags(unsigned long st_flags) {
    unsigned long flags = 0;
    if (st_flags & ST_NOSUID) flags |= MS_NOSUID;
    if (st_flags & ST_NODEV) flags |= MS_NODEV;
    if (st_flags & ST_NOEXEC) flags |= MS_NOEXEC;
    if (st_flags & ST_NOATIME) flags |= MS_NOATIME;
    if (st_flags & ST_NODIRATIME) flags |= MS_NODIRATIME;
    if (st_flags & ST_RELATIME) flags |= MS_RELATIME;
    return flags;
}

void enter_isolation(const ChildPlan& plan, int err_fd) {
    int flags = CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWIPC | CLONE_NEWUTS;
    if (!plan.allow_network) {
        flags |= CLONE_NEWNET;
    }
    if (unshare(flags) != 0) {
        child_fail(err_fd, "unshare");
    }

    if (!write_proc_file("/proc/self/setgroups", "deny") ||
        !write_proc_file("/proc/self/uid_map", plan.uid_map) ||
        !write_proc_file("/proc/self/gid_map", plan.gid_map)) {
        child_fail(err_fd, "id mapping");
    }

    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
        child_fail(err_fd, "make-private");
    }

    if (plan.read_only_root) {
        for (const auto& mount_point : plan.mount_points) {
            bool is_root = mount_point == "/";
            struct statvfs st;
            if (statvfs(mount_point.c_str(), &st) != 0) {
                if (is_root) child_fail(err_fd, "statvfs /");
                continue;
            }
            unsigned long remount = MS_REMOUNT | MS_BIND | MS_RDONLY | preserved_mount_flags(st.f_flag);
            // Pseudo filesystems refuse bind remounts; only the root is mandatory
            if (mount(nullptr, mount_point.c_str(), nullptr, remount, nullptr) != 0 && is_root) {
                child_fail(err_fd, "remount / read-only");
            }
        }
    }

    struct rlimit limit;
    limit.rlim_cur = limit.rlim_max = plan.cpu_seconds;
    if (setrlimit(RLIMIT_CPU, &limit) != 0) child_fail(err_fd, "RLIMIT_CPU");

    limit.rlim_cur = limit.rlim_max = MAX_OPEN_FILES;
    if (setrlimit(RLIMIT_NOFILE, &limit) != 0) child_fail(err_fd, "RLIMIT_NOFILE");

    limit.rlim_cur = limit.rlim_max = MAX_FILE_SIZE_BYTES;
    if (setrlimit(RLIMIT_FSIZE, &limit) != 0) child_fail(err_fd, "RLIMIT_FSIZE");

    limit.rlim_cur = limit.rlim_max = 0;
    if (setrlimit(RLIMIT_CORE, &limit) != 0) child_fail(err_fd, "RLIMIT_CORE");

    if (plan.address_space_bytes > 0) {
        limit.rlim_cur = limit.rlim_max = plan.address_space_bytes;
        if (setrlimit(RLIMIT_AS, &limit) != 0) child_fail(err_fd, "RLIMIT_AS");
    }

    // Installed last: the filter denies mount() and unshare()
    struct sock_fprog program;
    program.len = static_cast<unsigned short>(plan.seccomp_program.size());
    program.filter = const_cast<sock_filter*>(plan.seccomp_program.data());
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        child_fail(err_fd, "no_new_privs");
    }
    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &program) != 0) {
        child_fail(err_fd, "seccomp");
    }
}

[[noreturn]] void run_child(const ChildPlan& plan, int stdout_fd, int stderr_fd) {
    // Die with the service; never outlive it as an orphan
    prctl(PR_SET_PDEATHSIG, SIGKILL);
    setpgid(0, 0);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        close(devnull);
    }
    if (dup2(stdout_fd, STDOUT_FILENO) < 0 || dup2(stderr_fd, STDERR_FILENO) < 0) {
        _exit(ISOLATION_FAILURE_EXIT_CODE);
    }

    enter_isolation(plan, STDERR_FILENO);

    if (plan.probe_only) {
        _exit(0);
    }

    if (chdir(plan.working_directory.c_str()) != 0) {
        child_fail(STDERR_FILENO, "chdir");
    }

    execve(plan.executable.c_str(), plan.argv.data(), plan.envp.data());
    child_fail(STDERR_FILENO, "execve");
}

struct SeccompContext {
    scmp_filter_ctx ctx;
    explicit SeccompContext(uint32_t def_action) : ctx(seccomp_init(def_action)) {}
    ~SeccompContext() { if (ctx) seccomp_release(ctx); }
};

// Deny-list filter: the interpreter needs a broad syscall surface, so the filter
// removes what escapes the namespaces rather than enumerating what node uses.
std::vector<sock_filter> build_seccomp_program(bool allow_network) {
    SeccompContext filter(SCMP_ACT_ALLOW);
    if (!filter.ctx) {
        throw InternalError("seccomp_init failed");
    }

    const int denied[] = {
        SCMP_SYS(ptrace), SCMP_SYS(process_vm_readv), SCMP_SYS(process_vm_writev),
        SCMP_SYS(mount), SCMP_SYS(umount2), SCMP_SYS(pivot_root), SCMP_SYS(chroot),
        SCMP_SYS(setns), SCMP_SYS(unshare), SCMP_SYS(reboot), SCMP_SYS(kexec_load),
        SCMP_SYS(init_module), SCMP_SYS(finit_module), SCMP_SYS(delete_module),
        SCMP_SYS(swapon), SCMP_SYS(swapoff), SCMP_SYS(bpf), SCMP_SYS(perf_event_open),
        SCMP_SYS(keyctl), SCMP_SYS(add_key), SCMP_SYS(request_key), SCMP_SYS(userfaultfd),
        SCMP_SYS(fork), SCMP_SYS(vfork)
    };

    int rc = 0;
    for (int syscall_nr : denied) {
        rc = seccomp_rule_add(filter.ctx, SCMP_ACT_ERRNO(EPERM), syscall_nr, 0);
        if (rc < 0) break;
    }

    // Threads yes, new processes no
    if (rc >= 0) {
        rc = seccomp_rule_add(filter.ctx, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(clone), 1,
                              SCMP_A0(SCMP_CMP_MASKED_EQ, CLONE_THREAD, 0));
    }
    // clone3 flags live in a struct seccomp cannot inspect; ENOSYS makes libc fall back to clone
    if (rc >= 0) {
        rc = seccomp_rule_add(filter.ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(clone3), 0);
    }

    if (!allow_network) {
        const int families[] = {AF_INET, AF_INET6, AF_PACKET};
        for (int family : families) {
            if (rc < 0) break;
            rc = seccomp_rule_add(filter.ctx, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1,
                                  SCMP_A0(SCMP_CMP_EQ, static_cast<scmp_datum_t>(family)));
        }
    }

    if (rc < 0) {
        throw InternalError("seccomp_rule_add failed: " + std::string(std::strerror(-rc)));
    }

    int fd = memfd_create("mockrun-seccomp", MFD_CLOEXEC);
    if (fd < 0) {
        throw InternalError("memfd_create failed: " + std::string(std::strerror(errno)));
    }

    rc = seccomp_export_bpf(filter.ctx, fd);
    if (rc < 0) {
        close(fd);
        throw InternalError("seccomp_export_bpf failed: " + std::string(std::strerror(-rc)));
    }

    std::string bytes;
    char buffer[PIPE_BUFFER_SIZE];
    lseek(fd, 0, SEEK_SET);
    ssize_t n;
    while ((n = read(fd, buffer, sizeof(buffer))) > 0) {
        bytes.append(buffer, n);
    }
    close(fd);

    if (bytes.empty() || bytes.size() % sizeof(sock_filter) != 0) {
        throw InternalError("seccomp export produced a malformed program");
    }

    std::vector<sock_filter> program(bytes.size() / sizeof(sock_filter));
    std::memcpy(program.data(), bytes.data(), bytes.size());
    return program;
}

std::vector<std::string> read_mount_points() {
    std::vector<std::string> points;
    FILE* mounts = setmntent("/proc/self/mounts", "r");
    if (!mounts) {
        points.push_back("/");
        return points;
    }
    struct mntent entry;
    char buf[4096];
    while (getmntent_r(mounts, &entry, buf, sizeof(buf)) != nullptr) {
        points.push_back(entry.mnt_dir);
    }
    endmntent(mounts);

    if (std::find(points.begin(), points.end(), "/") == points.end()) {
        points.insert(points.begin(), "/");
    }
    return points;
}

ChildPlan make_plan(const SandboxConfig& config) {
    ChildPlan plan;
    plan.working_directory = config.working_directory;
    plan.uid_map = "0 " + std::to_string(getuid()) + " 1\n";
    plan.gid_map = "0 " + std::to_string(getgid()) + " 1\n";
    plan.mount_points = read_mount_points();
    plan.seccomp_program = build_seccomp_program(config.allow_network);
    plan.allow_network = config.allow_network;
    plan.read_only_root = config.read_only_root;

    auto secs = std::chrono::duration_cast<std::chrono::seconds>(config.timeout).count();
    plan.cpu_seconds = static_cast<rlim_t>(secs + 1);
    if (config.limit_address_space) {
        plan.address_space_bytes = static_cast<rlim_t>(config.memory_limit_bytes);
    }
    return plan;
}

std::string drain(int fd) {
    std::string out;
    char buffer[PIPE_BUFFER_SIZE];
    ssize_t n;
    while ((n = read(fd, buffer, sizeof(buffer))) > 0) {
        out.append(buffer, n);
    }
    return out;
}

} // namespace

class Sandbox::Impl {
public:
    SandboxConfig config_;

    explicit Impl(const SandboxConfig& config) : config_(config) {}

    ProcessResult run(const std::vector<std::string>& argv,
                      const std::function<void(pid_t)>& on_started) {
        if (argv.empty()) {
            throw InternalError("Sandbox::run called without a command");
        }

        ChildPlan plan = make_plan(config_);
        plan.executable = find_executable(argv[0]);
        if (plan.executable.empty()) {
            throw InternalError("Executable not found on PATH: " + argv[0]);
        }

        plan.argv_storage = argv;
        for (auto& arg : plan.argv_storage) plan.argv.push_back(arg.data());
        plan.argv.push_back(nullptr);

        plan.env_storage = config_.environment;
        if (plan.env_storage.empty()) {
            plan.env_storage = {
                "PATH=/usr/local/bin:/usr/bin:/bin",
                "HOME=" + config_.working_directory,
                "LANG=C.UTF-8"
            };
        }
        for (auto& var : plan.env_storage) plan.envp.push_back(var.data());
        plan.envp.push_back(nullptr);

        int stdout_pipe[2], stderr_pipe[2];
        if (pipe2(stdout_pipe, O_CLOEXEC) == -1) {
            throw InternalError("Failed to create pipes");
        }
        if (pipe2(stderr_pipe, O_CLOEXEC) == -1) {
            close(stdout_pipe[0]);
            close(stdout_pipe[1]);
            throw InternalError("Failed to create pipes");
        }

        auto start_time = std::chrono::steady_clock::now();
        pid_t pid = fork();
        if (pid == -1) {
            close(stdout_pipe[0]); close(stdout_pipe[1]);
            close(stderr_pipe[0]); close(stderr_pipe[1]);
            throw InternalError("Failed to fork process");
        }

        if (pid == 0) {
            run_child(plan, stdout_pipe[1], stderr_pipe[1]);
        }

        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        if (on_started) {
            on_started(pid);
        }

        ProcessResult result;
        collect_output(pid, stdout_pipe[0], stderr_pipe[0], start_time, result);

        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        int status = 0;
        while (waitpid(pid, &status, 0) == -1) {
            if (errno != EINTR) {
                throw InternalError("Failed to wait for child process");
            }
        }

        result.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.term_signal = WTERMSIG(status);
            result.exit_code = 128 + result.term_signal;
        }

        return result;
    }

private:
    void collect_output(pid_t pid, int out_fd, int err_fd,
                        std::chrono::steady_clock::time_point start_time,
                        ProcessResult& result) {
        fcntl(out_fd, F_SETFL, fcntl(out_fd, F_GETFL) | O_NONBLOCK);
        fcntl(err_fd, F_SETFL, fcntl(err_fd, F_GETFL) | O_NONBLOCK);

        auto deadline = start_time + config_.timeout;
        struct pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
        std::string* sinks[2] = {&result.stdout_output, &result.stderr_output};
        int open_count = 2;
        int polls_after_kill = 0;
        char buffer[PIPE_BUFFER_SIZE];

        while (open_count > 0) {
            auto now = std::chrono::steady_clock::now();
            if (!result.timeout_occurred && now >= deadline) {
                kill(-pid, SIGKILL);
                kill(pid, SIGKILL);
                result.timeout_occurred = true;
            }
            if (result.timeout_occurred && ++polls_after_kill > 20) {
                break;
            }

            int wait_ms = 100;
            if (!result.timeout_occurred) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
                wait_ms = static_cast<int>(std::max<long long>(1, remaining.count()));
            }

            int rc = poll(fds, 2, wait_ms);
            if (rc < 0) {
                if (errno == EINTR) continue;
                break;
            }

            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

                ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
                if (n > 0) {
                    if (sinks[i]->size() + n > MAX_OUTPUT_SIZE) {
                        result.output_truncated = true;
                    } else {
                        sinks[i]->append(buffer, n);
                    }
                } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                    fds[i].fd = -1;
                    --open_count;
                }
            }
        }
    }
};

Sandbox::Sandbox(const SandboxConfig& config) : impl(std::make_unique<Impl>(config)) {}

Sandbox::~Sandbox() = default;

ProcessResult Sandbox::run(const std::vector<std::string>& argv,
                           const std::function<void(pid_t)>& on_started) {
    return impl->run(argv, on_started);
}

std::string Sandbox::probe_isolation() {
    SandboxConfig config;
    config.working_directory = "/";

    ChildPlan plan;
    try {
        plan = make_plan(config);
    } catch (const ExecutionError& e) {
        return e.what();
    }
    plan.probe_only = true;

    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) == -1) {
        return "Failed to create pipes";
    }

    pid_t pid = fork();
    if (pid == -1) {
        close(err_pipe[0]);
        close(err_pipe[1]);
        return "Failed to fork probe";
    }
    if (pid == 0) {
        run_child(plan, err_pipe[1], err_pipe[1]);
    }

    close(err_pipe[1]);
    std::string message = drain(err_pipe[0]);
    close(err_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) return "Failed to wait for probe";
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        return "";
    }
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
    if (message.empty()) {
        std::ostringstream reason;
        reason << "isolation probe exited with status " << status;
        return reason.str();
    }
    return message;
}

std::string Sandbox::find_executable(const std::string& name) {
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }

    const char* path_env = std::getenv("PATH");
    std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::istringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return "";
}

} // namespace mockrun
