#pragma once

#include "result.h"
#include <sys/types.h>
#include <chrono>
#include <string>
#include <vector>

namespace runbox {

struct ProcessResult {
    int exit_code = -1;             // 128 + signal when killed by a signal
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
};

// A helper process with captured output, in its own process group.
// The destructor kills and reaps it if it is still running.
class ChildProcess {
public:
    explicit ChildProcess(size_t max_output = 1024 * 1024);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // Starts argv[0] from PATH. Fails if the binary cannot be executed.
    Status spawn(const std::vector<std::string>& argv, const std::string& stdin_data = "");

    // Drains output and returns true once the process has exited
    bool wait_for(std::chrono::milliseconds max_wait);

    // Signals the whole process group
    void kill(int sig);

    bool exited() const { return exited_; }
    int exit_code() const { return exit_code_; }

    ProcessResult result() const;

private:
    bool drain(int& fd, std::string& buffer, bool& truncated);
    bool reap(int options);

    size_t max_output_;
    pid_t pid_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool exited_ = false;
    int exit_code_ = -1;
    std::string stdout_;
    std::string stderr_;
    bool stdout_truncated_ = false;
    bool stderr_truncated_ = false;
};

// Run to completion or until timeout (then SIGKILL). Only a failure to
// start is an error; a non-zero exit is reported in the result.
Result<ProcessResult> run_process(const std::vector<std::string>& argv,
                                  std::chrono::milliseconds timeout,
                                  size_t max_output = 1024 * 1024,
                                  const std::string& stdin_data = "");

// Space-joined argv; part of the derived image fingerprint, so keep it stable
std::string join_argv(const std::vector<std::string>& argv);

} // namespace runbox
