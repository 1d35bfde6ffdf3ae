#include "local_runtime.h"
#include "constants.h"
#include <sys/mman.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <sched.h>
#include <signal.h>
#include <unistd.h>
#include <linux/seccomp.h>
#include <seccomp.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

namespace runbox {

namespace {

const char* const DEFAULT_PATH = "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";
const char* const OWNER_FILE = "owner";

// Where a child died during setup; reported over the error pipe
enum ChildStage : int {
    StageProcessGroup,
    StageDeathSignal,
    StageRedirect,
    StageUnshare,
    StageIdMap,
    StageMounts,
    StageNoNewPrivs,
    StageLimits,
    StageChdir,
    StageSeccomp,
    StageExec
};

const char* stage_name(int stage) {
    switch (stage) {
        case StageProcessGroup: return "setpgid";
        case StageDeathSignal: return "prctl(PR_SET_PDEATHSIG)";
        case StageRedirect: return "redirect";
        case StageUnshare: return "unshare";
        case StageIdMap: return "id mapping";
        case StageMounts: return "read-only mounts";
        case StageNoNewPrivs: return "prctl(PR_SET_NO_NEW_PRIVS)";
        case StageLimits: return "setrlimit";
        case StageChdir: return "chdir";
        case StageSeccomp: return "seccomp";
        case StageExec: return "exec";
    }
    return "setup";
}

struct ChildFailure {
    int stage;
    int error;
};

// Async-signal-safe; used between fork and exec
bool write_proc_file(const char* path, const char* contents) {
    int fd = open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    size_t len = std::strlen(contents);
    bool ok = write(fd, contents, len) == static_cast<ssize_t>(len);
    close(fd);
    return ok;
}

unsigned long preserved_mount_flags(const char* path) {
    struct statvfs vfs;
    if (statvfs(path, &vfs) != 0) {
        return 0;
    }
    // Locked flags must be carried over or the remount fails in a user namespace
    unsigned long flags = 0;
    if (vfs.f_flag & ST_NOSUID) flags |= MS_NOSUID;
    if (vfs.f_flag & ST_NODEV) flags |= MS_NODEV;
    if (vfs.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
    if (vfs.f_flag & ST_NOATIME) flags |= MS_NOATIME;
    if (vfs.f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
    if (vfs.f_flag & ST_RELATIME) flags |= MS_RELATIME;
    return flags;
}

bool enter_namespaces(const char* uid_map, const char* gid_map) {
    if (unshare(CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWNET) != 0) {
        return false;
    }
    if (!write_proc_file("/proc/self/setgroups", "deny") ||
        !write_proc_file("/proc/self/uid_map", uid_map) ||
        !write_proc_file("/proc/self/gid_map", gid_map)) {
        return false;
    }
    return mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == 0;
}

std::vector<struct sock_filter> build_seccomp_filter() {
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (!ctx) {
        throw std::runtime_error("seccomp_init failed");
    }
    std::unique_ptr<void, void (*)(void*)> guard(ctx, [](void* c) { seccomp_release(c); });

    // No network: inet, inet6 and raw packet sockets fail as if firewalled
    for (int family : {AF_INET, AF_INET6, AF_PACKET}) {
        struct scmp_arg_cmp cmp = {0, SCMP_CMP_EQ, static_cast<scmp_datum_t>(family), 0};
        int rc = seccomp_rule_add_array(ctx, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1, &cmp);
        if (rc < 0) {
            throw std::runtime_error("seccomp_rule_add(socket): " + std::string(std::strerror(-rc)));
        }
    }

    const int denied[] = {
        SCMP_SYS(mount), SCMP_SYS(umount2), SCMP_SYS(pivot_root), SCMP_SYS(chroot),
        SCMP_SYS(unshare), SCMP_SYS(setns), SCMP_SYS(ptrace),
        SCMP_SYS(process_vm_readv), SCMP_SYS(process_vm_writev),
        SCMP_SYS(kexec_load), SCMP_SYS(init_module), SCMP_SYS(finit_module),
        SCMP_SYS(delete_module), SCMP_SYS(bpf), SCMP_SYS(perf_event_open),
        SCMP_SYS(keyctl), SCMP_SYS(add_key), SCMP_SYS(request_key), SCMP_SYS(reboot),
        SCMP_SYS(swapon), SCMP_SYS(swapoff), SCMP_SYS(acct), SCMP_SYS(settimeofday),
        SCMP_SYS(clock_settime), SCMP_SYS(open_by_handle_at),
    };
    for (int syscall : denied) {
        if (syscall < 0) {
            continue;  // Not present on this architecture
        }
        int rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), syscall, 0);
        if (rc < 0) {
            throw std::runtime_error("seccomp_rule_add(" + std::to_string(syscall) +
                                     "): " + std::strerror(-rc));
        }
    }

    // Export once; children install the raw program without touching the heap
    int fd = memfd_create("runbox-seccomp", MFD_CLOEXEC);
    if (fd < 0) {
        throw std::runtime_error(std::string("memfd_create: ") + std::strerror(errno));
    }
    int rc = seccomp_export_bpf(ctx, fd);
    if (rc < 0) {
        close(fd);
        throw std::runtime_error(std::string("seccomp_export_bpf: ") + std::strerror(-rc));
    }

    off_t size = lseek(fd, 0, SEEK_END);
    if (size <= 0 || size % static_cast<off_t>(sizeof(struct sock_filter)) != 0) {
        close(fd);
        throw std::runtime_error("seccomp_export_bpf produced an invalid program");
    }
    std::vector<struct sock_filter> filter(static_cast<size_t>(size) / sizeof(struct sock_filter));
    char* out = reinterpret_cast<char*>(filter.data());
    off_t offset = 0;
    while (offset < size) {
        ssize_t n = pread(fd, out + offset, static_cast<size_t>(size - offset), offset);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) {
                continue;
            }
            close(fd);
            throw std::runtime_error("reading exported seccomp program failed");
        }
        offset += n;
    }
    close(fd);
    return filter;
}

std::string read_capped(const std::string& path, size_t max_bytes, bool& truncated) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        truncated = false;
        return "";
    }
    std::string content(max_bytes, '\0');
    file.read(&content[0], static_cast<std::streamsize>(max_bytes));
    content.resize(static_cast<size_t>(file.gcount()));
    truncated = file.peek() != std::char_traits<char>::eof();
    return content;
}

} // namespace

struct LocalRuntime::Unit {
    UnitSpec spec;
    std::string scratch;
    std::string tmp_dir;
    std::string stdout_path;
    std::string stderr_path;
    pid_t pid = -1;
    bool exited = false;
    UnitExit unit_exit;

    // Container path -> host path
    std::string map_path(const std::string& value) const {
        auto translate = [&value](const std::string& container, const std::string& host,
                                  std::string& out) {
            if (value == container) {
                out = host;
                return true;
            }
            if (value.size() > container.size() &&
                value.compare(0, container.size(), container) == 0 &&
                value[container.size()] == '/') {
                out = host + value.substr(container.size());
                return true;
            }
            return false;
        };

        std::string mapped;
        for (const auto& mount : spec.mounts) {
            if (translate(mount.container_path, mount.host_path, mapped)) {
                return mapped;
            }
        }
        if (translate(UNIT_TMP_DIR, tmp_dir, mapped)) {
            return mapped;
        }
        return value;
    }
};

LocalRuntime::LocalRuntime(std::string scratch_root, bool strict_isolation)
    : scratch_root_(std::move(scratch_root)), strict_isolation_(strict_isolation) {
    filter_ = build_seccomp_filter();
    namespaces_supported_ = probe_namespaces();

    std::error_code ec;
    std::filesystem::create_directories(scratch_root_, ec);
    if (ec) {
        throw std::runtime_error("cannot create scratch root " + scratch_root_ + ": " +
                                 ec.message());
    }

    if (!namespaces_supported_) {
        if (strict_isolation_) {
            std::cerr << "[LocalRuntime] User namespaces unavailable; units will be refused "
                      << "(strict_isolation is on)" << std::endl;
        } else {
            std::cerr << "[LocalRuntime] Warning: user namespaces unavailable; running with "
                      << "seccomp and rlimits only" << std::endl;
        }
    }
}

LocalRuntime::~LocalRuntime() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, unit] : units_) {
            names.push_back(name);
        }
    }
    for (const auto& name : names) {
        if (!remove(name)) {
            std::cerr << "[LocalRuntime] Failed to remove " << name << std::endl;
        }
    }
}

bool LocalRuntime::probe_namespaces() {
    std::string uid_map = std::to_string(geteuid()) + " " + std::to_string(geteuid()) + " 1";
    std::string gid_map = std::to_string(getegid()) + " " + std::to_string(getegid()) + " 1";

    pid_t pid = fork();
    if (pid == 0) {
        _exit(enter_namespaces(uid_map.c_str(), gid_map.c_str()) ? 0 : 1);
    }
    if (pid < 0) {
        return false;
    }
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return false;
        }
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

bool LocalRuntime::available() {
    return access("/bin/sh", X_OK) == 0 && (namespaces_supported_ || !strict_isolation_);
}

Status LocalRuntime::ensure_image(const std::string&) {
    return Status::success();
}

Status LocalRuntime::build_image(const std::string& tag, const std::string&,
                                 const std::vector<std::string>&) {
    return make_error(ErrorKind::Infrastructure,
                      "cannot build " + tag + ": package provisioning needs the docker runtime");
}

std::shared_ptr<LocalRuntime::Unit> LocalRuntime::find(const std::string& unit) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = units_.find(unit);
    return it == units_.end() ? nullptr : it->second;
}

Result<std::string> LocalRuntime::create(const UnitSpec& spec) {
    if (spec.command.empty()) {
        return make_error(ErrorKind::Infrastructure, "empty command for " + spec.name);
    }
    for (const auto& mount : spec.mounts) {
        struct stat st;
        if (stat(mount.host_path.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
            return make_error(ErrorKind::Infrastructure,
                              "mount source is not a directory: " + mount.host_path);
        }
    }

    auto unit = std::make_shared<Unit>();
    unit->spec = spec;
    unit->scratch = scratch_root_ + "/" + spec.name;
    unit->tmp_dir = unit->scratch + "/tmp";
    unit->stdout_path = unit->scratch + "/stdout";
    unit->stderr_path = unit->scratch + "/stderr";

    if (mkdir(unit->scratch.c_str(), 0700) != 0) {
        return make_error(ErrorKind::Infrastructure,
                          "mkdir " + unit->scratch + ": " + std::strerror(errno));
    }
    if (mkdir(unit->tmp_dir.c_str(), 0700) != 0) {
        int saved = errno;
        std::error_code ec;
        std::filesystem::remove_all(unit->scratch, ec);
        return make_error(ErrorKind::Infrastructure,
                          "mkdir " + unit->tmp_dir + ": " + std::strerror(saved));
    }
    {
        std::ofstream owner(unit->scratch + "/" + OWNER_FILE);
        owner << getpid() << "\n";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!units_.emplace(spec.name, unit).second) {
        return make_error(ErrorKind::Infrastructure, "duplicate unit name " + spec.name);
    }
    return spec.name;
}

Status LocalRuntime::start(const std::string& name) {
    auto unit = find(name);
    if (!unit) {
        return make_error(ErrorKind::Infrastructure, "unknown unit " + name);
    }
    if (unit->pid > 0) {
        return make_error(ErrorKind::Infrastructure, name + " already started");
    }
    if (!namespaces_supported_ && strict_isolation_) {
        return make_error(ErrorKind::Infrastructure,
                          "user namespaces are unavailable and strict isolation is on");
    }
    return run_child(*unit);
}

Status LocalRuntime::run_child(Unit& unit) {
    const UnitSpec& spec = unit.spec;

    // Everything the child touches is prepared here; after fork it only
    // makes system calls.
    std::vector<std::string> args;
    for (const auto& arg : spec.command) {
        args.push_back(unit.map_path(arg));
    }
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_strings;
    const char* host_path = getenv("PATH");
    env_strings.push_back(std::string("PATH=") + (host_path ? host_path : DEFAULT_PATH));
    env_strings.push_back("TMPDIR=" + unit.tmp_dir);
    for (const auto& [key, value] : spec.env) {
        env_strings.push_back(key + "=" + unit.map_path(value));
    }
    std::vector<char*> envp;
    for (auto& entry : env_strings) {
        envp.push_back(&entry[0]);
    }
    envp.push_back(nullptr);

    std::string workdir = unit.map_path(spec.working_dir.empty() ? UNIT_TMP_DIR
                                                                 : spec.working_dir);
    std::vector<std::string> read_only;
    std::vector<unsigned long> read_only_flags;
    for (const auto& mount : spec.mounts) {
        if (mount.read_only) {
            read_only.push_back(mount.host_path);
            read_only_flags.push_back(preserved_mount_flags(mount.host_path.c_str()));
        }
    }

    std::string uid_map = std::to_string(geteuid()) + " " + std::to_string(geteuid()) + " 1";
    std::string gid_map = std::to_string(getegid()) + " " + std::to_string(getegid()) + " 1";
    const bool use_namespaces = namespaces_supported_;

    rlim_t memory = static_cast<rlim_t>(spec.memory_limit_bytes);
    rlim_t cpu_seconds = static_cast<rlim_t>(spec.cpu_time_backstop.count());
    struct sock_fprog program;
    program.len = static_cast<unsigned short>(filter_.size());
    program.filter = filter_.data();

    int out_fd = open(unit.stdout_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    int err_fd = open(unit.stderr_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
    int error_pipe[2] = {-1, -1};
    if (out_fd < 0 || err_fd < 0 || null_fd < 0 || pipe2(error_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        for (int fd : {out_fd, err_fd, null_fd, error_pipe[0], error_pipe[1]}) {
            if (fd >= 0) {
                close(fd);
            }
        }
        return make_error(ErrorKind::Infrastructure,
                          std::string("preparing unit output: ") + std::strerror(saved));
    }

    const pid_t parent = getpid();
    pid_t pid = fork();
    if (pid == 0) {
        auto die = [&](int stage) {
            ChildFailure failure{stage, errno};
            (void)!write(error_pipe[1], &failure, sizeof(failure));
            _exit(127);
        };

        close(error_pipe[0]);
        if (setpgid(0, 0) != 0) die(StageProcessGroup);
        if (prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0) != 0) die(StageDeathSignal);
        if (getppid() != parent) _exit(127);  // Engine died before the line above

        if (dup2(null_fd, STDIN_FILENO) < 0 || dup2(out_fd, STDOUT_FILENO) < 0 ||
            dup2(err_fd, STDERR_FILENO) < 0) {
            die(StageRedirect);
        }

        if (use_namespaces) {
            if (unshare(CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWNET) != 0) die(StageUnshare);
            if (!write_proc_file("/proc/self/setgroups", "deny") ||
                !write_proc_file("/proc/self/uid_map", uid_map.c_str()) ||
                !write_proc_file("/proc/self/gid_map", gid_map.c_str())) {
                die(StageIdMap);
            }
            if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) die(StageMounts);
            for (size_t i = 0; i < read_only.size(); ++i) {
                const char* path = read_only[i].c_str();
                if (mount(path, path, nullptr, MS_BIND | MS_REC, nullptr) != 0 ||
                    mount(nullptr, path, nullptr,
                          MS_REMOUNT | MS_BIND | MS_RDONLY | read_only_flags[i], nullptr) != 0) {
                    die(StageMounts);
                }
            }
        }

        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) die(StageNoNewPrivs);

        struct rlimit limit;
        if (memory > 0) {
            limit.rlim_cur = limit.rlim_max = memory;
            if (setrlimit(RLIMIT_AS, &limit) != 0) die(StageLimits);
        }
        if (cpu_seconds > 0) {
            // SIGXCPU at the soft limit, SIGKILL one second later
            limit.rlim_cur = cpu_seconds;
            limit.rlim_max = cpu_seconds + 1;
            if (setrlimit(RLIMIT_CPU, &limit) != 0) die(StageLimits);
        }
        limit.rlim_cur = limit.rlim_max = MAX_UNIT_FILE_SIZE;
        if (setrlimit(RLIMIT_FSIZE, &limit) != 0) die(StageLimits);
        limit.rlim_cur = limit.rlim_max = MAX_OPEN_FILES;
        if (setrlimit(RLIMIT_NOFILE, &limit) != 0) die(StageLimits);
        limit.rlim_cur = limit.rlim_max = 0;
        if (setrlimit(RLIMIT_CORE, &limit) != 0) die(StageLimits);

        if (chdir(workdir.c_str()) != 0) die(StageChdir);
        if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &program, 0, 0) != 0) die(StageSeccomp);

        ::signal(SIGPIPE, SIG_DFL);
        execvpe(argv[0], argv.data(), envp.data());
        die(StageExec);
    }

    int fork_errno = errno;
    close(out_fd);
    close(err_fd);
    close(null_fd);
    close(error_pipe[1]);

    if (pid < 0) {
        close(error_pipe[0]);
        return make_error(ErrorKind::Infrastructure,
                          std::string("fork: ") + std::strerror(fork_errno));
    }
    // Mirrors the child's own call; loses the race harmlessly after exec
    setpgid(pid, pid);

    ChildFailure failure{0, 0};
    ssize_t n;
    do {
        n = read(error_pipe[0], &failure, sizeof(failure));
    } while (n == -1 && errno == EINTR);
    close(error_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        unit.pid = pid;
        unit.exited = true;
        std::string message = std::string(stage_name(failure.stage)) + ": " +
                              std::strerror(failure.error);
        std::cerr << "[LocalRuntime] " << spec.name << " failed to start: " << message
                  << std::endl;
        return make_error(ErrorKind::Infrastructure, message);
    }

    unit.pid = pid;
    return Status::success();
}

Result<std::optional<UnitExit>> LocalRuntime::wait_for_exit(const std::string& name,
                                                            std::chrono::milliseconds max_wait) {
    auto unit = find(name);
    if (!unit || unit->pid <= 0) {
        return make_error(ErrorKind::Infrastructure, name + " was not started");
    }
    if (unit->exited) {
        return std::optional<UnitExit>(unit->unit_exit);
    }

    auto deadline = std::chrono::steady_clock::now() + max_wait;
    while (true) {
        int status = 0;
        pid_t ret = waitpid(unit->pid, &status, WNOHANG);
        if (ret == unit->pid) {
            unit->exited = true;
            if (WIFEXITED(status)) {
                unit->unit_exit.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                unit->unit_exit.term_signal = WTERMSIG(status);
                unit->unit_exit.exit_code = 128 + WTERMSIG(status);
            }
            return std::optional<UnitExit>(unit->unit_exit);
        }
        if (ret == -1 && errno != EINTR) {
            return make_error(ErrorKind::Infrastructure,
                              "waitpid " + name + ": " + std::strerror(errno));
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::optional<UnitExit>();
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(
            deadline - now, std::chrono::milliseconds(WAIT_POLL_INTERVAL_MS));
        std::this_thread::sleep_for(slice);
    }
}

Status LocalRuntime::signal(const std::string& name, UnitSignal signal) {
    auto unit = find(name);
    if (!unit || unit->pid <= 0) {
        return make_error(ErrorKind::Infrastructure, name + " was not started");
    }
    int sig = signal == UnitSignal::Kill ? SIGKILL : SIGTERM;
    // The group outlives its leader while background children remain
    if (::kill(-unit->pid, sig) != 0 && errno != ESRCH) {
        return make_error(ErrorKind::Infrastructure,
                          "kill " + name + ": " + std::strerror(errno));
    }
    return Status::success();
}

Result<UnitLogs> LocalRuntime::capture_logs(const std::string& name, size_t max_bytes) {
    auto unit = find(name);
    if (!unit) {
        return make_error(ErrorKind::Infrastructure, "unknown unit " + name);
    }
    UnitLogs logs;
    logs.stdout_text = read_capped(unit->stdout_path, max_bytes, logs.stdout_truncated);
    logs.stderr_text = read_capped(unit->stderr_path, max_bytes, logs.stderr_truncated);
    return logs;
}

Status LocalRuntime::remove(const std::string& name) {
    std::shared_ptr<Unit> unit;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = units_.find(name);
        if (it == units_.end()) {
            return Status::success();
        }
        unit = it->second;
        units_.erase(it);
    }

    if (unit->pid > 0) {
        ::kill(-unit->pid, SIGKILL);
        if (!unit->exited) {
            int status = 0;
            while (waitpid(unit->pid, &status, 0) == -1 && errno == EINTR) {
            }
            unit->exited = true;
        }
    }

    std::error_code ec;
    std::filesystem::remove_all(unit->scratch, ec);
    if (ec) {
        return make_error(ErrorKind::Infrastructure,
                          "removing " + unit->scratch + ": " + ec.message());
    }
    return Status::success();
}

size_t LocalRuntime::reap_orphans() {
    namespace fs = std::filesystem;
    size_t reaped = 0;
    std::error_code ec;
    for (fs::directory_iterator it(scratch_root_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_directory(ec)) {
            continue;
        }
        std::ifstream owner_file(it->path() / OWNER_FILE);
        pid_t owner = 0;
        if (!(owner_file >> owner) || owner <= 0 || owner == getpid()) {
            continue;
        }
        if (::kill(owner, 0) == 0 || errno != ESRCH) {
            continue;  // Owner still alive
        }

        std::error_code remove_ec;
        fs::remove_all(it->path(), remove_ec);
        if (remove_ec) {
            std::cerr << "[LocalRuntime] Failed to remove " << it->path() << ": "
                      << remove_ec.message() << std::endl;
            continue;
        }
        std::cout << "[LocalRuntime] Removed orphaned unit: " << it->path().filename().string()
                  << std::endl;
        ++reaped;
    }
    return reaped;
}

} // namespace runbox
