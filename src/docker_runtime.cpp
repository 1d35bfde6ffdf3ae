#include "docker_runtime.h"
#include "constants.h"
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <json/json.h>

namespace runbox {

namespace {

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string format_cpus(double cpus) {
    std::ostringstream oss;
    oss << cpus;
    return oss.str();
}

bool mentions_missing_unit(const std::string& stderr_text) {
    return stderr_text.find("No such container") != std::string::npos ||
           stderr_text.find("is not running") != std::string::npos;
}

Error cli_error(const std::string& what, const ProcessResult& result) {
    if (result.timed_out) {
        return make_error(ErrorKind::Infrastructure, what + " timed out");
    }
    std::string detail = trim(result.stderr_text);
    if (detail.empty()) {
        detail = "exit code " + std::to_string(result.exit_code);
    }
    return make_error(ErrorKind::Infrastructure, what + " failed: " + detail);
}

std::string local_hostname() {
    char buffer[256] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return "unknown";
    }
    return buffer;
}

} // namespace

DockerRuntime::DockerRuntime(std::string docker_binary)
    : binary_(std::move(docker_binary)), hostname_(local_hostname()) {
    owner_ = hostname_ + ":" + std::to_string(getpid());
    // A docker CLI that exits before reading stdin must not take the engine down
    ::signal(SIGPIPE, SIG_IGN);
}

DockerRuntime::~DockerRuntime() = default;

Result<ProcessResult> DockerRuntime::docker(const std::vector<std::string>& args,
                                            std::chrono::seconds timeout, size_t max_output,
                                            const std::string& stdin_data) const {
    std::vector<std::string> argv = {binary_};
    argv.insert(argv.end(), args.begin(), args.end());
    return run_process(argv, timeout, max_output, stdin_data);
}

bool DockerRuntime::available() {
    auto result = docker({"info", "--format", "{{.ServerVersion}}"}, std::chrono::seconds(10));
    return result && !result->timed_out && result->exit_code == 0;
}

Status DockerRuntime::ensure_image(const std::string& image) {
    auto inspect = docker({"image", "inspect", "--format", "{{.Id}}", image},
                          std::chrono::seconds(RUNTIME_COMMAND_TIMEOUT_SECONDS));
    if (!inspect) {
        return inspect.error();
    }
    if (!inspect->timed_out && inspect->exit_code == 0) {
        return Status::success();
    }

    std::cout << "[Docker] Pulling image: " << image << std::endl;
    auto pull = docker({"pull", image}, std::chrono::seconds(IMAGE_PULL_TIMEOUT_SECONDS));
    if (!pull) {
        return pull.error();
    }
    if (pull->timed_out || pull->exit_code != 0) {
        Error error = cli_error("docker pull " + image, *pull);
        std::cerr << "[Docker] " << error.message << std::endl;
        return error;
    }
    std::cout << "[Docker] Pulled image: " << image << std::endl;
    return Status::success();
}

std::string DockerRuntime::render_dockerfile(const std::string& base,
                                             const std::vector<std::string>& install_argv) {
    Json::Value run(Json::arrayValue);
    for (const auto& arg : install_argv) {
        run.append(arg);
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";

    std::ostringstream dockerfile;
    dockerfile << "FROM " << base << "\n";
    dockerfile << "RUN " << Json::writeString(builder, run) << "\n";
    return dockerfile.str();
}

Status DockerRuntime::build_image(const std::string& tag, const std::string& base,
                                  const std::vector<std::string>& install_argv) {
    Status base_ready = ensure_image(base);
    if (!base_ready) {
        return base_ready;
    }

    std::cout << "[Docker] Building image " << tag << " from " << base << std::endl;
    auto build = docker({"build", "--network", "default", "-t", tag, "-"},
                        std::chrono::seconds(IMAGE_BUILD_TIMEOUT_SECONDS), MAX_CLI_OUTPUT,
                        render_dockerfile(base, install_argv));
    if (!build) {
        return build.error();
    }
    if (build->timed_out || build->exit_code != 0) {
        Error error = cli_error("docker build " + tag, *build);
        std::cerr << "[Docker] " << error.message << std::endl;
        return error;
    }
    return Status::success();
}

Result<std::vector<std::string>> DockerRuntime::create_arguments(const UnitSpec& spec) const {
    std::vector<std::string> args = {
        "create",
        "--name", spec.name,
        "--label", std::string(UNIT_LABEL_MANAGED) + "=1",
        "--label", std::string(UNIT_LABEL_OWNER) + "=" + owner_,
        "--network", "none",
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "--read-only",
        "--tmpfs", std::string(UNIT_TMP_DIR) + ":rw,exec,nosuid,nodev,size=" +
                       std::to_string(TMPFS_SIZE_BYTES / (1024 * 1024)) + "m",
        "--memory", std::to_string(spec.memory_limit_bytes),
        "--memory-swap", std::to_string(spec.memory_limit_bytes),
        "--cpus", format_cpus(spec.cpu_limit),
        "--pids-limit", std::to_string(spec.pids_limit),
        "--ulimit", "nofile=" + std::to_string(MAX_OPEN_FILES) + ":" +
                        std::to_string(MAX_OPEN_FILES),
        "--ulimit", "core=0",
        "--log-driver", "json-file",
        "--log-opt", "max-size=10m",
    };

    for (const auto& mount : spec.mounts) {
        // The --mount syntax is comma separated
        if (mount.host_path.find(',') != std::string::npos ||
            mount.container_path.find(',') != std::string::npos) {
            return make_error(ErrorKind::Infrastructure,
                              "mount path contains a comma: " + mount.host_path);
        }
        std::string value = "type=bind,source=" + mount.host_path +
                            ",target=" + mount.container_path;
        if (mount.read_only) {
            value += ",readonly";
        }
        args.push_back("--mount");
        args.push_back(value);
    }

    if (!spec.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(spec.working_dir);
    }
    for (const auto& [name, value] : spec.env) {
        args.push_back("-e");
        args.push_back(name + "=" + value);
    }

    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    return args;
}

Result<std::string> DockerRuntime::create(const UnitSpec& spec) {
    Status image = ensure_image(spec.image);
    if (!image) {
        return image.error();
    }

    auto args = create_arguments(spec);
    if (!args) {
        return args.error();
    }

    auto created = docker(*args, std::chrono::seconds(RUNTIME_COMMAND_TIMEOUT_SECONDS));
    if (!created) {
        return created.error();
    }
    if (created->timed_out || created->exit_code != 0) {
        // A timed out create may still have produced the container
        if (!remove(spec.name)) {
            std::cerr << "[Docker] Leaving partially created " << spec.name
                      << " to orphan cleanup" << std::endl;
        }
        return cli_error("docker create " + spec.name, *created);
    }
    return spec.name;
}

Status DockerRuntime::start(const std::string& unit) {
    auto started = docker({"start", unit}, std::chrono::seconds(RUNTIME_COMMAND_TIMEOUT_SECONDS));
    if (!started) {
        return started.error();
    }
    if (started->timed_out || started->exit_code != 0) {
        return cli_error("docker start " + unit, *started);
    }

    auto waiter = std::make_shared<ChildProcess>(PIPE_BUFFER_SIZE);
    Status spawned = waiter->spawn({binary_, "wait", unit});
    if (!spawned) {
        return spawned;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    waiters_[unit] = waiter;
    return Status::success();
}

Result<UnitExit> DockerRuntime::inspect_exit(const std::string& unit) const {
    auto inspected = docker({"inspect", "--format", "{{json .State}}", unit},
                            std::chrono::seconds(RUNTIME_COMMAND_TIMEOUT_SECONDS));
    if (!inspected) {
        return inspected.error();
    }
    if (inspected->timed_out || inspected->exit_code != 0) {
        return cli_error("docker inspect " + unit, *inspected);
    }

    Json::Value state;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(inspected->stdout_text);
    if (!Json::parseFromStream(builder, stream, &state, &errors) || !state.isObject()) {
        return make_error(ErrorKind::Infrastructure,
                          "unparseable state for " + unit + ": " + errors);
    }
    if (state["Running"].asBool()) {
        return make_error(ErrorKind::Infrastructure, unit + " is still running");
    }

    UnitExit unit_exit;
    unit_exit.exit_code = state["ExitCode"].asInt();
    unit_exit.oom_killed = state["OOMKilled"].asBool();
    // Docker folds signals into the exit code the way shells do
    if (unit_exit.exit_code > 128 && unit_exit.exit_code < 128 + 65) {
        unit_exit.term_signal = unit_exit.exit_code - 128;
    }
    return unit_exit;
}

Result<std::optional<UnitExit>> DockerRuntime::wait_for_exit(const std::string& unit,
                                                             std::chrono::milliseconds max_wait) {
    std::shared_ptr<ChildProcess> waiter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = waiters_.find(unit);
        if (it != waiters_.end()) {
            waiter = it->second;
        }
    }
    if (!waiter) {
        return make_error(ErrorKind::Infrastructure, unit + " was not started");
    }

    if (!waiter->wait_for(max_wait)) {
        return std::optional<UnitExit>();
    }

    auto unit_exit = inspect_exit(unit);
    if (!unit_exit) {
        return unit_exit.error();
    }
    return std::optional<UnitExit>(*unit_exit);
}

Status DockerRuntime::signal(const std::string& unit, UnitSignal signal) {
    const char* name = signal == UnitSignal::Kill ? "KILL" : "TERM";
    auto killed = docker({"kill", "--signal", name, unit},
                         std::chrono::seconds(RUNTIME_COMMAND_TIMEOUT_SECONDS));
    if (!killed) {
        return killed.error();
    }
    if (killed->exit_code != 0 && !killed->timed_out && mentions_missing_unit(killed->stderr_text)) {
        return Status::success();  // Already gone
    }
    if (killed->timed_out || killed->exit_code != 0) {
        return cli_error(std::string("docker kill --signal ") + name + " " + unit, *killed);
    }
    return Status::success();
}

Result<UnitLogs> DockerRuntime::capture_logs(const std::string& unit, size_t max_bytes) {
    auto logs = docker({"logs", unit}, std::chrono::seconds(RUNTIME_COMMAND_TIMEOUT_SECONDS),
                       max_bytes);
    if (!logs) {
        return logs.error();
    }
    if (logs->timed_out || logs->exit_code != 0) {
        return cli_error("docker logs " + unit, *logs);
    }

    UnitLogs result;
    result.stdout_text = logs->stdout_text;
    result.stderr_text = logs->stderr_text;
    result.stdout_truncated = logs->stdout_truncated;
    result.stderr_truncated = logs->stderr_truncated;
    return result;
}

Status DockerRuntime::remove(const std::string& unit) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        waiters_.erase(unit);
    }

    auto removed = docker({"rm", "-f", unit}, std::chrono::seconds(RUNTIME_COMMAND_TIMEOUT_SECONDS));
    if (!removed) {
        return removed.error();
    }
    if (removed->exit_code != 0 && !removed->timed_out &&
        mentions_missing_unit(removed->stderr_text)) {
        return Status::success();
    }
    if (removed->timed_out || removed->exit_code != 0) {
        Error error = cli_error("docker rm -f " + unit, *removed);
        std::cerr << "[Docker] " << error.message << std::endl;
        return error;
    }
    return Status::success();
}

size_t DockerRuntime::reap_orphans() {
    auto listed = docker({"ps", "-a", "--filter", std::string("label=") + UNIT_LABEL_MANAGED + "=1",
                          "--format", std::string("{{.Names}} {{.Label \"") + UNIT_LABEL_OWNER +
                                          "\"}}"},
                         std::chrono::seconds(RUNTIME_COMMAND_TIMEOUT_SECONDS));
    if (!listed || listed->timed_out || listed->exit_code != 0) {
        std::cerr << "[Docker] Could not list managed containers; skipping orphan cleanup"
                  << std::endl;
        return 0;
    }

    size_t reaped = 0;
    std::istringstream lines(listed->stdout_text);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream fields(line);
        std::string unit, owner;
        if (!(fields >> unit >> owner)) {
            continue;
        }

        size_t colon = owner.rfind(':');
        if (colon == std::string::npos || owner.substr(0, colon) != hostname_) {
            continue;  // Another host's engine, not ours to judge
        }
        pid_t pid = static_cast<pid_t>(std::atol(owner.substr(colon + 1).c_str()));
        if (pid <= 0 || pid == getpid()) {
            continue;
        }
        if (::kill(pid, 0) == 0 || errno != ESRCH) {
            continue;  // Owner still alive
        }

        if (remove(unit)) {
            std::cout << "[Docker] Removed orphaned container: " << unit << std::endl;
            ++reaped;
        }
    }
    return reaped;
}

} // namespace runbox
