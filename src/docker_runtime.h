#pragma once

#include "container_runtime.h"
#include "process_utils.h"
#include <map>
#include <memory>
#include <mutex>

namespace runbox {

// ContainerRuntime over the docker CLI. Each unit is one container created
// with every hardening flag; a background "docker wait" per started unit
// provides the exit notification.
class DockerRuntime : public ContainerRuntime {
public:
    explicit DockerRuntime(std::string docker_binary = "docker");
    ~DockerRuntime() override;

    std::string name() const override { return "docker"; }
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

    // Arguments after the binary for "docker create"
    Result<std::vector<std::string>> create_arguments(const UnitSpec& spec) const;

    // FROM base + RUN in exec form
    static std::string render_dockerfile(const std::string& base,
                                         const std::vector<std::string>& install_argv);

    // "<hostname>:<pid>" of this engine instance
    const std::string& owner() const { return owner_; }

private:
    Result<ProcessResult> docker(const std::vector<std::string>& args,
                                 std::chrono::seconds timeout,
                                 size_t max_output = 1024 * 1024,
                                 const std::string& stdin_data = "") const;
    Result<UnitExit> inspect_exit(const std::string& unit) const;

    std::string binary_;
    std::string owner_;
    std::string hostname_;

    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ChildProcess>> waiters_;
};

} // namespace runbox
