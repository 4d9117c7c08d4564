#pragma once

#include <atomic>
#include <ctime>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <core/types.hpp>
#include <platform/process.hpp>
#include "command_queue.hpp"
#include "completion_detector.hpp"
#include "event_log.hpp"
#include "input_dispatcher.hpp"
#include "output_multiplexer.hpp"

// One run of the managed process and the workers bound to its pipes:
// stdout multiplexer, stderr reader, input dispatcher and completion monitors.
// A crashed session is stopped and replaced, never restarted in place.
class Session {
public:
    // on_failure is called from worker threads when the process looks dead
    // (stdout EOF, stdin write failure). It must not block.
    Session(const BridgeConfig& cfg, CommandQueue& queue, EventLogSink& sink,
            std::function<void()> on_failure);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Spawn, settle, send init commands, drain init output, then dispatch.
    Result<void> start();

    // Terminate the process (grace_ms before SIGKILL) and join all workers.
    void stop(int grace_ms);

    // Process still running (reaps it once exited).
    bool alive();
    std::optional<int> exit_status() const;

    // Send a raw line that is not tracked as a command.
    Result<void> write_line(const std::string& text);

    SessionState state() const { return state_; }
    void set_state(SessionState s) { state_ = s; }

    int pid() const { return pid_; }
    std::time_t started_at() const { return started_at_; }

private:
    const BridgeConfig& cfg_;
    CommandQueue& queue_;
    EventLogSink& sink_;
    std::function<void()> on_failure_;

    // Lock order: stdin_mutex_ before proc_mutex_
    std::mutex stdin_mutex_;
    mutable std::mutex proc_mutex_;
    platform::ProcessHandle proc_;

    std::unique_ptr<OutputMultiplexer> mux_;
    std::unique_ptr<CompletionDetector> detector_;
    std::unique_ptr<InputDispatcher> dispatcher_;
    std::thread stderr_thread_;

    std::atomic<SessionState> state_{SessionState::Starting};
    std::atomic<bool> running_{false};
    std::atomic<int> pid_{0};
    std::atomic<std::time_t> started_at_{0};

    Result<void> write_raw(const std::string& data);
    Result<void> send_init_commands();
    bool drain_init_output();
    void stderr_loop(int fd);
};
