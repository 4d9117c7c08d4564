#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "command_queue.hpp"

// Watches in-flight commands and completes each one once the managed
// process has produced no output for the quiescence window.
//
// One monitor thread per command. A monitor sleeps until the exact moment
// the command would become quiet (or hit its deadline) and is woken early by
// new output. It exits when the command releases the process slot.
class CompletionDetector {
public:
    CompletionDetector(CommandQueue& queue, std::chrono::milliseconds quiescence);
    ~CompletionDetector();

    CompletionDetector(const CompletionDetector&) = delete;
    CompletionDetector& operator=(const CompletionDetector&) = delete;

    // Start monitoring a command that was just moved in flight.
    void watch(const CommandPtr& cmd);

    // Cancel every monitor and join its thread.
    void stop_all();

    // Monitors whose thread has not finished yet.
    size_t active() const;

private:
    CommandQueue& queue_;
    std::chrono::milliseconds quiescence_;

    struct Entry {
        std::thread thread;
        std::atomic<bool> canceled{false};
        std::atomic<bool> done{false};
    };
    std::map<std::string, std::unique_ptr<Entry>> monitors_;
    mutable std::mutex mutex_;

    void monitor_thread(CommandPtr cmd, Entry* entry);
    void reap_finished_locked();
};
