#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <core/types.hpp>

namespace platform {

// Handle to a spawned child process with its stdio connected to pipes.
// Owns the pid and the parent ends of the three pipes.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running. Reaps the child once it exits.
    bool running();

    // Exit status once reaped: exit code, or 128+signal if killed by a signal.
    std::optional<int> exit_status() const { return exit_status_; }

    // Wait for the process to exit. Returns exit status, -1 on timeout.
    // timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // SIGTERM, wait up to grace_ms, then SIGKILL.
    void terminate(int grace_ms = 2000);

    // Write all bytes to the child's stdin. Fails on EPIPE / closed pipe.
    // The pipe is non-blocking: while it is full, cancelled() is checked
    // every STDIN_POLL_MS and a true result abandons the write.
    Result<void> write_stdin(const std::string& data,
                             const std::function<bool()>& cancelled = {});

    // Close the write end of stdin (child sees EOF).
    void close_stdin();

    int pid() const { return pid_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

private:
    int pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::optional<int> exit_status_;

    void record_status(int status);
    void close_fds();

    friend Result<ProcessHandle> spawn_piped(const std::string& program,
                                             const std::vector<std::string>& args);
};

// Spawn program (PATH lookup) with stdin/stdout/stderr on pipes.
// exec failures surface as the child exiting with status 127.
Result<ProcessHandle> spawn_piped(const std::string& program,
                                  const std::vector<std::string>& args);

} // namespace platform
