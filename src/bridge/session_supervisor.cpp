#include "session_supervisor.hpp"
#include "command_line.hpp"
#include <core/config.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

SessionSupervisor::SessionSupervisor(BridgeConfig cfg)
    : cfg_(std::move(cfg)), sink_(event_log_path_for(cfg_)) {}

SessionSupervisor::~SessionSupervisor() {
    shutdown();
}

// ── Lifecycle ──────────────────────────────────────────────────

Result<void> SessionSupervisor::start() {
    if (running_) return Result<void>::Ok();
    running_ = true;

    bridge_log(fmt::format("Supervisor: {} on {} (device {}), events -> {}",
                           cfg_.program, cfg_.serial_port, cfg_.device_name,
                           sink_.path().string()));

    bool ok = start_session();
    monitor_thread_ = std::thread(&SessionSupervisor::monitor_loop, this);

    if (!ok) {
        return Result<void>::Err(fmt::format("initial session failed, retrying every {}s",
                                             cfg_.restart_backoff_secs));
    }
    return Result<void>::Ok();
}

void SessionSupervisor::shutdown() {
    if (!running_.exchange(false)) return;
    stopped_ = true;
    bridge_log("Supervisor: shutting down");

    request_health_check();
    if (monitor_thread_.joinable()) monitor_thread_.join();

    auto s = session();
    if (s) {
        s->stop(cfg_.shutdown_grace_ms);
        s->set_state(SessionState::Stopped);
    }

    size_t n = queue_.fail_all(CommandError::Shutdown, "bridge shutting down");
    if (n) bridge_log(fmt::format("Supervisor: failed {} pending command(s) on shutdown", n));
}

std::shared_ptr<Session> SessionSupervisor::session() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_;
}

void SessionSupervisor::request_health_check() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        wake_requested_ = true;
    }
    wake_cv_.notify_all();
}

bool SessionSupervisor::start_session() {
    auto s = std::make_shared<Session>(cfg_, queue_, sink_,
                                       [this] { request_health_check(); });
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_ = s;
    }

    auto r = s->start();
    if (r.is_err()) {
        bridge_log_error(fmt::format("Supervisor: session start failed: {}", r.error));
        s->stop(0);
        s->set_state(SessionState::Crashed);
        return false;
    }
    ever_running_ = true;
    return true;
}

void SessionSupervisor::handle_crash(const std::shared_ptr<Session>& s) {
    bridge_log_error(fmt::format("Supervisor: meshcli (pid {}) exited with status {}",
                                 s->pid(), s->exit_status().value_or(-1)));

    s->stop(0);
    size_t n = queue_.fail_all(CommandError::SessionCrashed, "meshcli process crashed");
    if (n) bridge_log_warn(fmt::format("Supervisor: failed {} pending command(s)", n));

    s->set_state(SessionState::Restarting);
    restarts_++;
    start_session();
}

// ── Health monitor ─────────────────────────────────────────────

void SessionSupervisor::monitor_loop() {
    while (running_) {
        auto s = session();
        bool crashed = s && s->state() == SessionState::Crashed;
        auto interval = std::chrono::seconds(crashed ? cfg_.restart_backoff_secs
                                                     : cfg_.health_check_secs);
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            // A failed start only retries on the back-off, not on wake-ups
            wake_cv_.wait_for(lock, interval, [&] {
                return !running_ || (wake_requested_ && !crashed);
            });
            wake_requested_ = false;
        }
        if (!running_) break;

        s = session();
        if (!s) continue;

        if (s->state() == SessionState::Crashed) {
            bridge_log(fmt::format("Supervisor: retrying start (attempt after {}s back-off)",
                                   cfg_.restart_backoff_secs));
            s->set_state(SessionState::Restarting);
            restarts_++;
            start_session();
            continue;
        }

        if (s->state() == SessionState::Running && !s->alive()) {
            handle_crash(s);
        }
    }
}

// ── Commands ───────────────────────────────────────────────────

std::chrono::milliseconds SessionSupervisor::default_timeout(
    const std::vector<std::string>& args) const {
    if (!args.empty() && args.front() == RECV_COMMAND) {
        return std::chrono::seconds(cfg_.timeouts.recv_secs);
    }
    return std::chrono::seconds(cfg_.timeouts.default_secs);
}

CommandResult SessionSupervisor::execute(const std::vector<std::string>& args,
                                         std::optional<std::chrono::milliseconds> timeout) {
    auto line = build_command_line(args);
    if (line.is_err()) {
        return CommandResult::fail(CommandError::Malformed, line.error);
    }
    return execute_line(line.value, timeout.value_or(default_timeout(args)));
}

CommandResult SessionSupervisor::execute_line(const std::string& text,
                                              std::chrono::milliseconds timeout) {
    auto valid = validate_command_text(text);
    if (valid.is_err()) {
        return CommandResult::fail(CommandError::Malformed, valid.error);
    }
    if (stopped_) {
        return CommandResult::fail(CommandError::Shutdown, "bridge is shutting down");
    }
    if (!ever_running_) {
        return CommandResult::fail(CommandError::NotRunning, "meshcli session not running");
    }

    auto cmd = queue_.submit(text, timeout);
    auto result = queue_.wait(cmd);
    bridge_log_command(cmd->id, text, result);
    return result;
}

BridgeHealth SessionSupervisor::health() const {
    BridgeHealth h;
    h.serial_port = cfg_.serial_port;
    h.device_name = cfg_.device_name;
    h.advert_log = sink_.path().string();
    h.restarts = restarts_;
    h.pending_commands = queue_.pending();
    h.in_flight = queue_.in_flight_id();

    auto s = session();
    if (s) {
        h.state = s->state();
        h.pid = s->pid();
        h.session_started = to_iso(s->started_at());
    }
    h.healthy = running_ && h.state == SessionState::Running;
    return h;
}
