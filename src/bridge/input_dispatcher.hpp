#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <core/types.hpp>
#include "command_queue.hpp"
#include "completion_detector.hpp"

// Moves queued commands onto the managed process's stdin, one at a time.
// The next command is only taken once the previous one released the slot.
class InputDispatcher {
public:
    // Writes raw bytes to the process's stdin.
    using WriteFn = std::function<Result<void>(const std::string&)>;

    InputDispatcher(CommandQueue& queue, CompletionDetector& detector,
                    WriteFn write, std::function<void()> on_write_failure);
    ~InputDispatcher();

    InputDispatcher(const InputDispatcher&) = delete;
    InputDispatcher& operator=(const InputDispatcher&) = delete;

    void start();
    void stop();

private:
    CommandQueue& queue_;
    CompletionDetector& detector_;
    WriteFn write_;
    std::function<void()> on_write_failure_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    void dispatch_loop();
};
