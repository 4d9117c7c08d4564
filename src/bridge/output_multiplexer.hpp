#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include "command_queue.hpp"
#include "event_log.hpp"
#include "record_accumulator.hpp"

// Reads the managed process's stdout and routes every line.
//
// Lines are grouped into records by a RecordAccumulator. Event records go to
// the event log; response records are appended to the in-flight command.
// Response lines with nothing in flight are discarded.
class OutputMultiplexer {
public:
    using Clock = std::chrono::steady_clock;
    using EofCallback = std::function<void()>;

    OutputMultiplexer(int stdout_fd, CommandQueue& queue, EventLogSink& sink,
                      EventClassifier classifier, EofCallback on_eof = nullptr);
    ~OutputMultiplexer();

    OutputMultiplexer(const OutputMultiplexer&) = delete;
    OutputMultiplexer& operator=(const OutputMultiplexer&) = delete;

    void start();
    void stop();

    // Time of the most recent physical line (construction time if none).
    Clock::time_point last_output_at() const;

private:
    int fd_;
    CommandQueue& queue_;
    EventLogSink& sink_;
    RecordAccumulator accumulator_;
    EofCallback on_eof_;

    std::thread reader_thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex time_mutex_;
    Clock::time_point last_output_at_;

    void reader_loop();
    void route(std::vector<ClassifiedRecord> records);
};
