#include "completion_detector.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

CompletionDetector::CompletionDetector(CommandQueue& queue,
                                       std::chrono::milliseconds quiescence)
    : queue_(queue), quiescence_(quiescence) {}

CompletionDetector::~CompletionDetector() {
    stop_all();
}

void CompletionDetector::watch(const CommandPtr& cmd) {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_finished_locked();
    if (monitors_.count(cmd->id)) return;

    auto entry = std::make_unique<Entry>();
    auto* raw = entry.get();
    entry->thread = std::thread(&CompletionDetector::monitor_thread, this, cmd, raw);
    monitors_[cmd->id] = std::move(entry);
}

void CompletionDetector::stop_all() {
    std::map<std::string, std::unique_ptr<Entry>> local;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        local.swap(monitors_);
    }
    for (auto& [id, e] : local) e->canceled.store(true);
    queue_.wake_all();
    for (auto& [id, e] : local) {
        if (e->thread.joinable()) e->thread.join();
    }
}

size_t CompletionDetector::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& [id, e] : monitors_) {
        if (!e->done.load()) n++;
    }
    return n;
}

void CompletionDetector::reap_finished_locked() {
    for (auto it = monitors_.begin(); it != monitors_.end();) {
        if (it->second->done.load()) {
            if (it->second->thread.joinable()) it->second->thread.join();
            it = monitors_.erase(it);
        } else {
            ++it;
        }
    }
}

void CompletionDetector::monitor_thread(CommandPtr cmd, Entry* entry) {
    using Clock = CommandQueue::Clock;

    auto st = queue_.slot_status(cmd);
    while (!entry->canceled.load() && st.held) {
        auto now = Clock::now();
        auto quiet_at = st.last_line_at + quiescence_;

        if (now >= quiet_at && queue_.complete_if_quiescent(cmd, quiescence_)) break;

        if (!st.terminal && now >= st.deadline && queue_.expire_if_due(cmd)) {
            bridge_log_warn(fmt::format("[{}] timed out, process still busy", cmd->id));
        }

        // Sleep until the earlier of quiet time and deadline, or new activity
        auto until = quiet_at;
        if (!st.terminal && st.deadline < until) until = st.deadline;
        st = queue_.wait_activity(cmd, st.seq, until, entry->canceled);
    }
    entry->done.store(true);
}
