#include "command_queue.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

// ── Internal helpers (mutex_ held) ────────────────────────────

bool CommandQueue::finish_locked(Command& cmd, CommandResult result) {
    if (cmd.terminal()) return false;  // exactly once
    cmd.state = CommandState::Terminal;
    cmd.result = std::move(result);
    done_cv_.notify_all();
    return true;
}

void CommandQueue::release_locked(const CommandPtr& cmd) {
    if (in_flight_ == cmd) {
        in_flight_.reset();
        queue_cv_.notify_all();
    }
    registry_.erase(cmd->id);
    note_activity_locked();
}

void CommandQueue::note_activity_locked() {
    activity_seq_++;
    activity_cv_.notify_all();
}

CommandQueue::SlotStatus CommandQueue::status_locked(const CommandPtr& cmd) const {
    SlotStatus st;
    st.held = (in_flight_ == cmd);
    st.terminal = cmd->terminal();
    st.last_line_at = cmd->last_line_at;
    st.deadline = cmd->deadline;
    st.seq = activity_seq_;
    return st;
}

std::string CommandQueue::unique_id_locked() const {
    std::string id = random_hex_id(8);
    while (registry_.count(id)) id = random_hex_id(8);
    return id;
}

// ── Caller side ───────────────────────────────────────────────

CommandPtr CommandQueue::submit(const std::string& text, std::chrono::milliseconds timeout) {
    timeout = std::min<std::chrono::milliseconds>(timeout, std::chrono::seconds(MAX_CMD_TIMEOUT_SECS));
    auto cmd = std::make_shared<Command>();
    cmd->text = text;
    cmd->submitted_at = Clock::now();
    cmd->deadline = cmd->submitted_at + timeout;
    cmd->last_line_at = cmd->submitted_at;

    std::lock_guard<std::mutex> lock(mutex_);
    cmd->id = unique_id_locked();
    registry_[cmd->id] = cmd;
    queue_.push_back(cmd);
    queue_cv_.notify_all();
    return cmd;
}

CommandResult CommandQueue::wait(const CommandPtr& cmd) {
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait_until(lock, cmd->deadline, [&] { return cmd->terminal(); });

    if (!cmd->terminal()) {
        auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
            cmd->deadline - cmd->submitted_at);
        finish_locked(*cmd, CommandResult::fail(CommandError::Timeout,
            fmt::format("Command timeout after {} seconds", waited.count() / 1000.0)));

        if (cmd->state == CommandState::Terminal && in_flight_ != cmd) {
            // Never dispatched: drop it so the dispatcher never sends it
            queue_.erase(std::remove(queue_.begin(), queue_.end(), cmd), queue_.end());
            registry_.erase(cmd->id);
        }
    }
    return cmd->result;
}

std::optional<CommandResult> CommandQueue::poll(const CommandPtr& cmd) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cmd->terminal()) return std::nullopt;
    return cmd->result;
}

// ── Dispatcher side ───────────────────────────────────────────

CommandPtr CommandQueue::next(const std::atomic<bool>& stop) {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        queue_cv_.wait(lock, [&] {
            return stop.load() || (!in_flight_ && !queue_.empty());
        });
        if (stop.load()) return nullptr;

        CommandPtr cmd = queue_.front();
        queue_.pop_front();

        if (cmd->terminal()) {
            registry_.erase(cmd->id);
            continue;
        }
        if (Clock::now() >= cmd->deadline) {
            finish_locked(*cmd, CommandResult::fail(CommandError::Timeout,
                "Command timeout before dispatch"));
            registry_.erase(cmd->id);
            continue;
        }

        cmd->state = CommandState::InFlight;
        cmd->last_line_at = Clock::now();
        in_flight_ = cmd;
        note_activity_locked();
        return cmd;
    }
}

void CommandQueue::fail(const CommandPtr& cmd, CommandError err, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    finish_locked(*cmd, CommandResult::fail(err, reason));
    queue_.erase(std::remove(queue_.begin(), queue_.end(), cmd), queue_.end());
    release_locked(cmd);
}

// ── Output multiplexer side ───────────────────────────────────

bool CommandQueue::append_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!in_flight_) return false;
    in_flight_->lines.push_back(line);
    in_flight_->last_line_at = Clock::now();
    note_activity_locked();
    return true;
}

void CommandQueue::touch() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!in_flight_) return;
    in_flight_->last_line_at = Clock::now();
    note_activity_locked();
}

// ── Completion detector side ──────────────────────────────────

CommandQueue::SlotStatus CommandQueue::slot_status(const CommandPtr& cmd) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_locked(cmd);
}

CommandQueue::SlotStatus CommandQueue::wait_activity(const CommandPtr& cmd, uint64_t seen_seq,
                                                     Clock::time_point until,
                                                     const std::atomic<bool>& stop) {
    std::unique_lock<std::mutex> lock(mutex_);
    activity_cv_.wait_until(lock, until, [&] {
        return stop.load() || activity_seq_ != seen_seq || in_flight_ != cmd;
    });
    return status_locked(cmd);
}

bool CommandQueue::expire_if_due(const CommandPtr& cmd) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cmd->terminal() || Clock::now() < cmd->deadline) return false;
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        cmd->deadline - cmd->submitted_at);
    return finish_locked(*cmd, CommandResult::fail(CommandError::Timeout,
        fmt::format("Command timeout after {} seconds", waited.count() / 1000.0)));
}

bool CommandQueue::complete_if_quiescent(const CommandPtr& cmd,
                                         std::chrono::milliseconds quiescence) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_flight_ != cmd) return true;
    if (Clock::now() - cmd->last_line_at < quiescence) return false;

    if (!finish_locked(*cmd, CommandResult::ok(join_lines(cmd->lines)))) {
        // Caller already timed out; whatever arrived since is dropped here
        if (!cmd->lines.empty()) {
            bridge_log_debug(fmt::format("[{}] dropped {} line(s) after timeout",
                                         cmd->id, cmd->lines.size()));
        }
    }
    release_locked(cmd);
    return true;
}

// ── Supervisor side ───────────────────────────────────────────

size_t CommandQueue::fail_all(CommandError err, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t failed = 0;
    for (auto& [id, cmd] : registry_) {
        if (finish_locked(*cmd, CommandResult::fail(err, reason))) failed++;
    }
    registry_.clear();
    queue_.clear();
    in_flight_.reset();

    queue_cv_.notify_all();
    note_activity_locked();
    return failed;
}

void CommandQueue::wake_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_cv_.notify_all();
    note_activity_locked();
    done_cv_.notify_all();
}

// ── Introspection ─────────────────────────────────────────────

size_t CommandQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.size();
}

size_t CommandQueue::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::string CommandQueue::in_flight_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_ ? in_flight_->id : "";
}
