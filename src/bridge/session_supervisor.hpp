#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>
#include "command_queue.hpp"
#include "event_log.hpp"
#include "session.hpp"

// Point-in-time view of the bridge for health reporting.
struct BridgeHealth {
    bool healthy = false;
    SessionState state = SessionState::Stopped;
    std::string serial_port;
    std::string device_name;
    std::string advert_log;
    int pid = 0;                  // 0 when no process
    int restarts = 0;
    std::string session_started;  // ISO time, "" if never
    size_t pending_commands = 0;
    std::string in_flight;        // command id, "" if idle
};

// Headless service facade: owns the command queue, the event log and the
// current Session, and keeps a managed process running.
//
// The queue outlives sessions, so commands submitted while a replacement
// session is starting are dispatched once it is running.
class SessionSupervisor {
public:
    explicit SessionSupervisor(BridgeConfig cfg);
    ~SessionSupervisor();

    SessionSupervisor(const SessionSupervisor&) = delete;
    SessionSupervisor& operator=(const SessionSupervisor&) = delete;

    // ── Lifecycle ──────────────────────────────────────────────

    // Start the first session and the health monitor. A failed first start
    // is returned but the monitor keeps retrying after the back-off.
    Result<void> start();

    // Stop the monitor and the session, fail everything still pending.
    void shutdown();

    bool is_running() const { return running_; }

    // ── Commands ───────────────────────────────────────────────

    // Quote args into one line and run it. No timeout = default for args.
    CommandResult execute(const std::vector<std::string>& args,
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Run a pre-built line.
    CommandResult execute_line(const std::string& text, std::chrono::milliseconds timeout);

    // Default caller timeout: recv waits longer for radio traffic.
    std::chrono::milliseconds default_timeout(const std::vector<std::string>& args) const;

    // ── Introspection ──────────────────────────────────────────

    BridgeHealth health() const;
    const BridgeConfig& config() const { return cfg_; }
    CommandQueue& queue() { return queue_; }

    // Current session (null before start).
    std::shared_ptr<Session> session() const;

    // Wake the health monitor for an immediate check.
    void request_health_check();

private:
    BridgeConfig cfg_;
    CommandQueue queue_;
    EventLogSink sink_;

    mutable std::mutex session_mutex_;
    std::shared_ptr<Session> session_;

    std::thread monitor_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> ever_running_{false};
    std::atomic<int> restarts_{0};

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool wake_requested_ = false;

    bool start_session();
    void handle_crash(const std::shared_ptr<Session>& s);
    void monitor_loop();
};
