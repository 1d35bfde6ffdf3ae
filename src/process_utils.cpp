#include "process_utils.h"
#include "constants.h"
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace runbox {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

ChildProcess::ChildProcess(size_t max_output) : max_output_(max_output) {}

ChildProcess::~ChildProcess() {
    if (pid_ > 0 && !exited_) {
        ::kill(-pid_, SIGKILL);
        reap(0);
    }
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

Status ChildProcess::spawn(const std::vector<std::string>& argv, const std::string& stdin_data) {
    if (argv.empty()) {
        return make_error(ErrorKind::Infrastructure, "empty command");
    }
    if (pid_ > 0) {
        return make_error(ErrorKind::Infrastructure, "process already started");
    }

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        for (int* fds : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
    };
    if (pipe2(in_pipe, O_CLOEXEC) == -1 || pipe2(out_pipe, O_CLOEXEC) == -1 ||
        pipe2(err_pipe, O_CLOEXEC) == -1 || pipe2(exec_pipe, O_CLOEXEC) == -1) {
        int saved = errno;
        close_all();
        return make_error(ErrorKind::Infrastructure, std::string("pipe: ") + std::strerror(saved));
    }

    // Built before fork; the child only calls async-signal-safe functions
    std::vector<char*> args;
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        int saved = errno;
        close_all();
        return make_error(ErrorKind::Infrastructure, std::string("fork: ") + std::strerror(saved));
    }

    if (pid == 0) {
        setpgid(0, 0);
        if (dup2(in_pipe[0], STDIN_FILENO) == -1 || dup2(out_pipe[1], STDOUT_FILENO) == -1 ||
            dup2(err_pipe[1], STDERR_FILENO) == -1) {
            int err = errno;
            (void)!write(exec_pipe[1], &err, sizeof(err));
            _exit(127);
        }
        signal(SIGPIPE, SIG_DFL);
        execvp(args[0], args.data());
        int err = errno;
        (void)!write(exec_pipe[1], &err, sizeof(err));
        _exit(127);
    }

    pid_ = pid;
    setpgid(pid_, pid_);  // Also from the parent so kill(-pid) works immediately
    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(exec_pipe[1]);

    // Closed on successful exec, so a read of 0 bytes means the binary is running
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR);
    close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        close(in_pipe[1]);
        close(out_pipe[0]);
        close(err_pipe[0]);
        reap(0);
        return make_error(ErrorKind::Infrastructure,
                          "cannot execute " + argv[0] + ": " + std::strerror(exec_errno));
    }

    size_t written = 0;
    while (written < stdin_data.size()) {
        ssize_t w = write(in_pipe[1], stdin_data.data() + written, stdin_data.size() - written);
        if (w < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;  // Child closed stdin early; its exit status tells the story
        }
        written += static_cast<size_t>(w);
    }
    close(in_pipe[1]);

    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    fcntl(stdout_fd_, F_SETFL, fcntl(stdout_fd_, F_GETFL) | O_NONBLOCK);
    fcntl(stderr_fd_, F_SETFL, fcntl(stderr_fd_, F_GETFL) | O_NONBLOCK);
    return Status::success();
}

// Returns false once the descriptor reached EOF
bool ChildProcess::drain(int& fd, std::string& buffer, bool& truncated) {
    if (fd < 0) {
        return false;
    }
    char chunk[PIPE_BUFFER_SIZE];
    while (true) {
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            size_t room = buffer.size() < max_output_ ? max_output_ - buffer.size() : 0;
            size_t keep = std::min(room, static_cast<size_t>(n));
            buffer.append(chunk, keep);
            if (keep < static_cast<size_t>(n)) {
                truncated = true;
            }
            continue;
        }
        if (n == 0) {
            close_fd(fd);
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        close_fd(fd);
        return false;
    }
}

bool ChildProcess::reap(int options) {
    if (pid_ <= 0 || exited_) {
        return exited_;
    }
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, options);
    } while (ret == -1 && errno == EINTR);

    if (ret == pid_) {
        exited_ = true;
        exit_code_ = decode_wait_status(status);
    } else if (ret == -1) {
        // Already reaped elsewhere; nothing left to wait for
        exited_ = true;
    }
    return exited_;
}

bool ChildProcess::wait_for(std::chrono::milliseconds max_wait) {
    if (pid_ <= 0) {
        return true;
    }
    auto deadline = std::chrono::steady_clock::now() + max_wait;
    while (true) {
        drain(stdout_fd_, stdout_, stdout_truncated_);
        drain(stderr_fd_, stderr_, stderr_truncated_);

        if (reap(WNOHANG)) {
            // Pick up whatever was written just before exit
            drain(stdout_fd_, stdout_, stdout_truncated_);
            drain(stderr_fd_, stderr_, stderr_truncated_);
            return true;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int timeout_ms = static_cast<int>(
            std::min<long long>(remaining.count(), WAIT_POLL_INTERVAL_MS));

        struct pollfd fds[2];
        nfds_t count = 0;
        for (int fd : {stdout_fd_, stderr_fd_}) {
            if (fd >= 0) {
                fds[count].fd = fd;
                fds[count].events = POLLIN;
                fds[count].revents = 0;
                ++count;
            }
        }
        if (count > 0) {
            poll(fds, count, std::max(timeout_ms, 1));
        } else {
            usleep(static_cast<useconds_t>(std::max(timeout_ms, 1)) * 1000);
        }
    }
}

void ChildProcess::kill(int sig) {
    if (pid_ > 0 && !exited_) {
        ::kill(-pid_, sig);
    }
}

ProcessResult ChildProcess::result() const {
    ProcessResult result;
    result.exit_code = exit_code_;
    result.stdout_text = stdout_;
    result.stderr_text = stderr_;
    result.stdout_truncated = stdout_truncated_;
    result.stderr_truncated = stderr_truncated_;
    return result;
}

Result<ProcessResult> run_process(const std::vector<std::string>& argv,
                                  std::chrono::milliseconds timeout, size_t max_output,
                                  const std::string& stdin_data) {
    ChildProcess child(max_output);
    Status started = child.spawn(argv, stdin_data);
    if (!started) {
        return started.error();
    }

    if (child.wait_for(timeout)) {
        return child.result();
    }

    child.kill(SIGKILL);
    child.wait_for(std::chrono::milliseconds(KILL_WAIT_MS));
    ProcessResult result = child.result();
    result.timed_out = true;
    return result;
}

std::string join_argv(const std::vector<std::string>& argv) {
    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    return joined;
}

} // namespace runbox
