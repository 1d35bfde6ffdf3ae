#pragma once

#include "result.h"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace runbox {

struct Mount {
    std::string host_path;
    std::string container_path;
    bool read_only = true;
};

// Everything needed to create one execution unit. Hardening (no network,
// no capabilities, read-only root, no-new-privileges) is always applied by
// the runtime and has no field here.
struct UnitSpec {
    std::string name;
    std::string image;
    std::vector<std::string> command;
    std::vector<Mount> mounts;
    std::map<std::string, std::string> env;
    std::string working_dir;
    uint64_t memory_limit_bytes = 0;
    double cpu_limit = 0;
    int pids_limit = 0;
    std::chrono::seconds cpu_time_backstop{0};   // RLIMIT_CPU where supported
};

struct UnitExit {
    int exit_code = 0;          // 128 + signal when killed by a signal
    int term_signal = 0;        // 0 when the unit exited normally
    bool oom_killed = false;
};

struct UnitLogs {
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
};

enum class UnitSignal {
    Terminate,
    Kill
};

// Isolation backend. All methods report failures as ErrorKind::Infrastructure
// and never throw. Implementations must be safe to call from several
// executions at once.
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    virtual std::string name() const = 0;

    // Cheap reachability probe
    virtual bool available() = 0;

    // Make the image usable locally, pulling it if needed
    virtual Status ensure_image(const std::string& image) = 0;

    // Build tag FROM base with one install step
    virtual Status build_image(const std::string& tag, const std::string& base,
                               const std::vector<std::string>& install_argv) = 0;

    // Returns the unit handle
    virtual Result<std::string> create(const UnitSpec& spec) = 0;
    virtual Status start(const std::string& unit) = 0;

    // Waits up to max_wait. An empty optional means the unit is still running.
    virtual Result<std::optional<UnitExit>> wait_for_exit(const std::string& unit,
                                                          std::chrono::milliseconds max_wait) = 0;

    virtual Status signal(const std::string& unit, UnitSignal signal) = 0;

    // Output so far, capped at max_bytes per stream
    virtual Result<UnitLogs> capture_logs(const std::string& unit, size_t max_bytes) = 0;

    // Idempotent; removing an unknown unit succeeds
    virtual Status remove(const std::string& unit) = 0;

    // Remove units left behind by dead engine instances. Returns how many.
    virtual size_t reap_orphans() = 0;
};

} // namespace runbox
