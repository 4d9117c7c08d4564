#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "command.hpp"

// FIFO of pending commands plus the registry of every queued or in-flight
// command. The managed process runs one command at a time; the slot is held
// by the in-flight command until its output has gone quiet, even if the
// caller already gave up on it.
//
// One mutex guards queue, registry, slot and every Command's mutable fields.
// It is shared by callers, the dispatcher, the output multiplexer, the
// completion detector and the supervisor.
class CommandQueue {
public:
    using Clock = Command::Clock;

    // Snapshot of the slot as seen by the completion detector.
    struct SlotStatus {
        bool held = false;              // cmd still occupies the process
        bool terminal = false;
        Clock::time_point last_line_at;
        Clock::time_point deadline;
        uint64_t seq = 0;               // activity counter
    };

    CommandQueue() = default;
    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    // ── Caller side ────────────────────────────────────────────

    // Queue text for dispatch. Never blocks.
    CommandPtr submit(const std::string& text, std::chrono::milliseconds timeout);

    // Block until cmd is terminal. At the deadline the command is failed with
    // a timeout (an in-flight command keeps the slot until quiescence).
    CommandResult wait(const CommandPtr& cmd);

    // Terminal result if reached, without blocking.
    std::optional<CommandResult> poll(const CommandPtr& cmd) const;

    // ── Dispatcher side ────────────────────────────────────────

    // Block until the slot is free and a live command is queued, then move it
    // in flight. Commands that expired while queued are skipped.
    // Returns nullptr once stop is set.
    CommandPtr next(const std::atomic<bool>& stop);

    // Fail cmd and free the slot (e.g. stdin write failed).
    void fail(const CommandPtr& cmd, CommandError err, const std::string& reason);

    // ── Output multiplexer side ────────────────────────────────

    // Append a response line to the in-flight command. False if none (discarded).
    bool append_line(const std::string& line);

    // Record activity on the in-flight command without adding content.
    void touch();

    // ── Completion detector side ───────────────────────────────

    SlotStatus slot_status(const CommandPtr& cmd) const;

    // Wait until activity newer than seen_seq or until `until`.
    SlotStatus wait_activity(const CommandPtr& cmd, uint64_t seen_seq,
                             Clock::time_point until, const std::atomic<bool>& stop);

    // Fail cmd with a timeout if its deadline has passed; slot stays held.
    bool expire_if_due(const CommandPtr& cmd);

    // Complete cmd and free the slot if it has been idle for quiescence.
    // True once cmd no longer holds the slot.
    bool complete_if_quiescent(const CommandPtr& cmd, std::chrono::milliseconds quiescence);

    // ── Supervisor side ────────────────────────────────────────

    // Fail every queued and in-flight command, clear queue, registry and slot.
    size_t fail_all(CommandError err, const std::string& reason);

    // Wake every blocked waiter so it can re-check its stop flag.
    void wake_all();

    // ── Introspection ──────────────────────────────────────────

    size_t pending() const;
    size_t queued() const;
    std::string in_flight_id() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;      // dispatcher: slot freed / command queued
    std::condition_variable activity_cv_;   // detector: lines, touches, releases
    std::condition_variable done_cv_;       // callers: a command went terminal

    std::deque<CommandPtr> queue_;
    std::unordered_map<std::string, CommandPtr> registry_;
    CommandPtr in_flight_;
    uint64_t activity_seq_ = 0;

    bool finish_locked(Command& cmd, CommandResult result);
    void release_locked(const CommandPtr& cmd);
    void note_activity_locked();
    SlotStatus status_locked(const CommandPtr& cmd) const;
    std::string unique_id_locked() const;
};
