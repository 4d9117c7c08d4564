#include "input_dispatcher.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

InputDispatcher::InputDispatcher(CommandQueue& queue, CompletionDetector& detector,
                                 WriteFn write, std::function<void()> on_write_failure)
    : queue_(queue), detector_(detector),
      write_(std::move(write)), on_write_failure_(std::move(on_write_failure)) {}

InputDispatcher::~InputDispatcher() {
    stop();
}

void InputDispatcher::start() {
    if (running_) return;
    stopping_ = false;
    running_ = true;
    thread_ = std::thread(&InputDispatcher::dispatch_loop, this);
}

void InputDispatcher::stop() {
    if (!running_) return;
    stopping_ = true;
    queue_.wake_all();
    if (thread_.joinable()) thread_.join();
    running_ = false;
}

void InputDispatcher::dispatch_loop() {
    while (!stopping_) {
        CommandPtr cmd = queue_.next(stopping_);
        if (!cmd) break;

        bridge_log_debug(fmt::format("[{}] -> {}", cmd->id, cmd->text));
        auto w = write_(cmd->text + "\n");
        if (w.is_err()) {
            // Stopping: the session owner fails everything still pending
            if (stopping_) break;
            bridge_log_error(fmt::format("[{}] stdin write failed: {}", cmd->id, w.error));
            queue_.fail(cmd, CommandError::SessionCrashed,
                        fmt::format("meshcli process crashed ({})", w.error));
            if (on_write_failure_) on_write_failure_();
            continue;
        }

        detector_.watch(cmd);
    }
}
