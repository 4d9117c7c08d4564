#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_fds();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), stdin_fd_(other.stdin_fd_),
      stdout_fd_(other.stdout_fd_), stderr_fd_(other.stderr_fd_),
      exit_status_(other.exit_status_) {
    other.pid_ = -1;
    other.stdin_fd_ = -1;
    other.stdout_fd_ = -1;
    other.stderr_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_fds();
        pid_ = other.pid_;
        stdin_fd_ = other.stdin_fd_;
        stdout_fd_ = other.stdout_fd_;
        stderr_fd_ = other.stderr_fd_;
        exit_status_ = other.exit_status_;
        other.pid_ = -1;
        other.stdin_fd_ = -1;
        other.stdout_fd_ = -1;
        other.stderr_fd_ = -1;
    }
    return *this;
}

void ProcessHandle::close_fds() {
    for (int* fd : {&stdin_fd_, &stdout_fd_, &stderr_fd_}) {
        if (*fd >= 0) {
            close(*fd);
            *fd = -1;
        }
    }
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

void ProcessHandle::record_status(int status) {
    if (WIFEXITED(status)) {
        exit_status_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_status_ = 128 + WTERMSIG(status);
    } else {
        exit_status_ = -1;
    }
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || exit_status_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == 0) return true;  // 0 means still running
    if (ret == pid_) {
        record_status(status);
    } else {
        exit_status_ = -1;  // already reaped elsewhere or not our child
    }
    return false;
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (exit_status_) return *exit_status_;

    if (timeout_ms < 0) {
        int status;
        if (waitpid(pid_, &status, 0) == pid_) {
            record_status(status);
        } else {
            exit_status_ = -1;
        }
        return *exit_status_;
    }

    // Poll with timeout
    int elapsed = 0;
    while (elapsed < timeout_ms) {
        if (!running()) return exit_status_.value_or(-1);
        sleep_ms(50);
        elapsed += 50;
    }
    return running() ? -1 : exit_status_.value_or(-1);
}

void ProcessHandle::terminate(int grace_ms) {
    if (pid_ <= 0 || !running()) return;

    close_stdin();
    kill(pid_, SIGTERM);
    if (wait(grace_ms) == -1 && running()) {
        kill(pid_, SIGKILL);
        wait();
    }
}

Result<void> ProcessHandle::write_stdin(const std::string& data,
                                        const std::function<bool()>& cancelled) {
    if (stdin_fd_ < 0) {
        return Result<void>::Err("stdin is closed");
    }

    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t w = write(stdin_fd_, data.data() + sent, data.size() - sent);
        if (w >= 0) {
            sent += static_cast<size_t>(w);
            continue;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            return Result<void>::Err(fmt::format("write to stdin failed: {}", std::strerror(errno)));
        }

        // Pipe full: the child is not reading
        if (cancelled && cancelled()) {
            return Result<void>::Err(fmt::format("write to stdin abandoned after {} of {} bytes",
                                                 sent, data.size()));
        }
        struct pollfd pfd = {stdin_fd_, POLLOUT, 0};
        if (poll(&pfd, 1, STDIN_POLL_MS) < 0 && errno != EINTR) {
            return Result<void>::Err(fmt::format("poll on stdin failed: {}", std::strerror(errno)));
        }
    }
    return Result<void>::Ok();
}

void ProcessHandle::close_stdin() {
    if (stdin_fd_ >= 0) {
        close(stdin_fd_);
        stdin_fd_ = -1;
    }
}

// ── spawn ────────────────────────────────────────────────────

static void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
}

Result<ProcessHandle> spawn_piped(const std::string& program,
                                  const std::vector<std::string>& args) {
    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};

    if (pipe2(in_pipe, O_CLOEXEC) < 0 || pipe2(out_pipe, O_CLOEXEC) < 0 ||
        pipe2(err_pipe, O_CLOEXEC) < 0) {
        std::string reason = std::strerror(errno);
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        return Result<ProcessHandle>::Err("pipe() failed: " + reason);
    }

    // Build argv before fork: the child may only make async-signal-safe calls
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        std::string reason = std::strerror(errno);
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        return Result<ProcessHandle>::Err("fork() failed: " + reason);
    }

    if (pid == 0) {
        // Child process: own process group so terminal signals stay with the bridge
        setpgid(0, 0);
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent: only our end of stdin is non-blocking
    close(in_pipe[0]);
    fcntl(in_pipe[1], F_SETFL, fcntl(in_pipe[1], F_GETFL) | O_NONBLOCK);
    close(out_pipe[1]);
    close(err_pipe[1]);

    ProcessHandle handle;
    handle.pid_ = pid;
    handle.stdin_fd_ = in_pipe[1];
    handle.stdout_fd_ = out_pipe[0];
    handle.stderr_fd_ = err_pipe[0];
    return Result<ProcessHandle>::Ok(std::move(handle));
}

} // namespace platform
