#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>

enum class CommandState { Queued, InFlight, Terminal };

// One caller request against the managed process.
// Everything below `deadline` is guarded by the owning CommandQueue's mutex.
struct Command {
    using Clock = std::chrono::steady_clock;

    std::string id;
    std::string text;
    Clock::time_point submitted_at;
    Clock::time_point deadline;

    CommandState state = CommandState::Queued;
    std::vector<std::string> lines;
    Clock::time_point last_line_at;
    CommandResult result;

    bool terminal() const { return state == CommandState::Terminal; }
};

using CommandPtr = std::shared_ptr<Command>;
