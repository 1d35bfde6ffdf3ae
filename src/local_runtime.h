#pragma once

#include "container_runtime.h"
#include <linux/filter.h>
#include <sys/types.h>
#include <map>
#include <memory>
#include <mutex>

namespace runbox {

// ContainerRuntime that runs units as host processes. Used where Docker is
// not available and by the integration tests.
//
// Each unit gets its own process group, no_new_privs, rlimits and a seccomp
// filter that denies network sockets and namespace, mount, ptrace and module
// syscalls. When unprivileged user namespaces work, the unit also gets a
// private user, mount and network namespace in which code/ and data/ are
// re-bound read-only. Images are ignored; commands resolve against the host
// PATH. Container paths (/code, /data, /output, /tmp) in the command, working
// directory and environment are mapped to their host directories.
class LocalRuntime : public ContainerRuntime {
public:
    // Throws std::runtime_error if the seccomp filter cannot be built
    explicit LocalRuntime(std::string scratch_root = "/tmp/runbox_units",
                          bool strict_isolation = true);
    ~LocalRuntime() override;

    std::string name() const override { return "local"; }
    bool available() override;
    Status ensure_image(const std::string& image) override;
    Status build_image(const std::string& tag, const std::string& base,
                       const std::vector<std::string>& install_argv) override;
    Result<std::string> create(const UnitSpec& spec) override;
    Status start(const std::string& unit) override;
    Result<std::optional<UnitExit>> wait_for_exit(const std::string& unit,
                                                  std::chrono::milliseconds max_wait) override;
    Status signal(const std::string& unit, UnitSignal signal) override;
    Result<UnitLogs> capture_logs(const std::string& unit, size_t max_bytes) override;
    Status remove(const std::string& unit) override;
    size_t reap_orphans() override;

    bool namespaces_supported() const { return namespaces_supported_; }

    // Can this process create user+mount+net namespaces?
    static bool probe_namespaces();

private:
    struct Unit;

    std::shared_ptr<Unit> find(const std::string& unit);
    Status run_child(Unit& unit);

    std::string scratch_root_;
    bool strict_isolation_;
    bool namespaces_supported_ = false;
    std::vector<struct sock_filter> filter_;

    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Unit>> units_;
};

} // namespace runbox
