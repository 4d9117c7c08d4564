#include "session.hpp"
#include "command_line.hpp"
#include <core/config.hpp>
#include <core/log.hpp>
#include <core/settings.hpp>
#include <platform/line_reader.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>

Session::Session(const BridgeConfig& cfg, CommandQueue& queue, EventLogSink& sink,
                 std::function<void()> on_failure)
    : cfg_(cfg), queue_(queue), sink_(sink), on_failure_(std::move(on_failure)) {}

Session::~Session() {
    stop(0);
}

// ── Lifecycle ──────────────────────────────────────────────────

Result<void> Session::start() {
    state_ = SessionState::Starting;

    auto args = expand_program_args(cfg_);
    auto spawned = platform::spawn_piped(cfg_.program, args);
    if (spawned.is_err()) {
        state_ = SessionState::Crashed;
        return Result<void>::Err(fmt::format("spawn {} failed: {}", cfg_.program, spawned.error));
    }

    int stdout_fd, stderr_fd;
    {
        std::lock_guard<std::mutex> lock(proc_mutex_);
        proc_ = std::move(spawned.value);
        pid_ = proc_.pid();
        stdout_fd = proc_.stdout_fd();
        stderr_fd = proc_.stderr_fd();
    }
    started_at_ = std::time(nullptr);
    running_ = true;
    bridge_log(fmt::format("Session: started {} (pid {})", cfg_.program, pid_.load()));

    mux_ = std::make_unique<OutputMultiplexer>(stdout_fd, queue_, sink_,
                                               EventClassifier(cfg_.event_types),
                                               on_failure_);
    mux_->start();
    stderr_thread_ = std::thread(&Session::stderr_loop, this, stderr_fd);

    // Give the program time to open the serial device
    platform::sleep_ms(cfg_.init_settle_ms);
    if (!alive()) {
        state_ = SessionState::Crashed;
        return Result<void>::Err(fmt::format("{} exited during startup (status {})",
                                             cfg_.program, exit_status().value_or(-1)));
    }

    auto init = send_init_commands();
    if (init.is_err()) {
        state_ = SessionState::Crashed;
        return init;
    }

    if (!drain_init_output()) {
        bridge_log_warn("Session: init output still arriving, dispatching anyway");
    }

    detector_ = std::make_unique<CompletionDetector>(
        queue_, std::chrono::milliseconds(cfg_.quiescence_ms));
    dispatcher_ = std::make_unique<InputDispatcher>(
        queue_, *detector_,
        [this](const std::string& data) { return write_raw(data); },
        on_failure_);
    dispatcher_->start();

    state_ = SessionState::Running;
    bridge_log("Session: running");
    return Result<void>::Ok();
}

void Session::stop(int grace_ms) {
    bool was_running = running_.exchange(false);

    // Clearing running_ abandons a write blocked on a full stdin pipe,
    // so the dispatcher joins even when the process stopped reading.
    if (dispatcher_) dispatcher_->stop();

    {
        std::lock_guard<std::mutex> stdin_lock(stdin_mutex_);
        std::lock_guard<std::mutex> lock(proc_mutex_);
        if (proc_.valid()) proc_.terminate(grace_ms);
    }

    if (detector_) detector_->stop_all();
    if (mux_) mux_->stop();
    if (stderr_thread_.joinable()) stderr_thread_.join();

    if (was_running) {
        bridge_log(fmt::format("Session: pid {} stopped (status {})",
                               pid_.load(), exit_status().value_or(-1)));
    }
}

bool Session::alive() {
    std::lock_guard<std::mutex> lock(proc_mutex_);
    return proc_.valid() && proc_.running();
}

std::optional<int> Session::exit_status() const {
    std::lock_guard<std::mutex> lock(proc_mutex_);
    return proc_.exit_status();
}

Result<void> Session::write_line(const std::string& text) {
    auto valid = validate_command_text(text);
    if (valid.is_err()) return valid;
    return write_raw(text + "\n");
}

// Holds only stdin_mutex_: liveness checks must not wait behind a full pipe
Result<void> Session::write_raw(const std::string& data) {
    std::lock_guard<std::mutex> lock(stdin_mutex_);
    return proc_.write_stdin(data, [this] { return !running_; });
}

// ── Initialization ─────────────────────────────────────────────

Result<void> Session::send_init_commands() {
    auto settings = load_session_settings(settings_path_for(cfg_));
    if (settings.is_err()) {
        bridge_log_warn(fmt::format("Session: ignoring settings file: {}", settings.error));
        settings = Result<SessionSettings>::Ok(SessionSettings{});
    }

    for (const auto& cmd : build_init_commands(cfg_, settings.value)) {
        auto w = write_line(cmd);
        if (w.is_err()) {
            return Result<void>::Err(fmt::format("init command '{}' failed: {}", cmd, w.error));
        }
        bridge_log(fmt::format("Session: init -> {}", cmd));
    }
    return Result<void>::Ok();
}

bool Session::drain_init_output() {
    using Clock = OutputMultiplexer::Clock;
    auto quiet = std::chrono::milliseconds(cfg_.quiescence_ms);
    auto give_up = Clock::now() + std::chrono::milliseconds(INIT_DRAIN_MAX_MS);

    // Wait for one full quiescence window after the last init write
    auto floor = Clock::now();
    while (Clock::now() < give_up) {
        auto last = std::max(mux_->last_output_at(), floor);
        auto quiet_at = last + quiet;
        auto now = Clock::now();
        if (now >= quiet_at) return true;
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(quiet_at - now);
        platform::sleep_ms(static_cast<int>(wait.count()) + 1);
    }
    return false;
}

// ── stderr ─────────────────────────────────────────────────────

void Session::stderr_loop(int fd) {
    platform::LineReader reader(fd);
    std::vector<std::string> lines;

    while (running_) {
        lines.clear();
        auto status = reader.read_lines(lines, STDERR_POLL_MS);
        for (const auto& line : lines) {
            if (!line.empty()) bridge_log_warn(fmt::format("meshcli stderr: {}", line));
        }
        if (status == platform::LineReader::Status::Eof ||
            status == platform::LineReader::Status::Error) {
            break;
        }
    }
}
