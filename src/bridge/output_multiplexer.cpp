#include "output_multiplexer.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/line_reader.hpp>
#include <fmt/format.h>

OutputMultiplexer::OutputMultiplexer(int stdout_fd, CommandQueue& queue, EventLogSink& sink,
                                     EventClassifier classifier, EofCallback on_eof)
    : fd_(stdout_fd), queue_(queue), sink_(sink),
      accumulator_(std::move(classifier)), on_eof_(std::move(on_eof)),
      last_output_at_(Clock::now()) {}

OutputMultiplexer::~OutputMultiplexer() {
    stop();
}

void OutputMultiplexer::start() {
    if (running_) return;
    running_ = true;
    reader_thread_ = std::thread(&OutputMultiplexer::reader_loop, this);
}

void OutputMultiplexer::stop() {
    running_ = false;
    if (reader_thread_.joinable())
        reader_thread_.join();
}

OutputMultiplexer::Clock::time_point OutputMultiplexer::last_output_at() const {
    std::lock_guard<std::mutex> lock(time_mutex_);
    return last_output_at_;
}

// ── Routing ────────────────────────────────────────────────────

void OutputMultiplexer::route(std::vector<ClassifiedRecord> records) {
    for (auto& rec : records) {
        if (rec.is_event()) {
            // Failures are already logged by the sink
            // Events never feed the in-flight command's idle timer
            (void)sink_.append(std::move(rec.payload));
            continue;
        }

        for (const auto& line : rec.lines) {
            if (!queue_.append_line(line)) {
                bridge_log_debug(fmt::format("unassociated output: {}", line));
            }
        }
    }
}

void OutputMultiplexer::reader_loop() {
    platform::LineReader reader(fd_);
    std::vector<std::string> lines;

    while (running_) {
        lines.clear();
        auto status = reader.read_lines(lines, RECORD_FLUSH_MS);

        if (!lines.empty()) {
            std::lock_guard<std::mutex> lock(time_mutex_);
            last_output_at_ = Clock::now();
        }

        for (const auto& line : lines) {
            route(accumulator_.feed(line));
            // A record still being assembled keeps the command alive
            if (accumulator_.open()) queue_.touch();
        }

        if (status == platform::LineReader::Status::Idle) {
            // Nothing new within the flush window: release a partial record
            if (accumulator_.open()) route(accumulator_.flush());
            continue;
        }

        if (status == platform::LineReader::Status::Eof ||
            status == platform::LineReader::Status::Error) {
            route(accumulator_.flush());
            bridge_log_warn(status == platform::LineReader::Status::Eof
                ? "meshcli stdout closed"
                : "meshcli stdout read error");
            if (on_eof_) on_eof_();
            break;
        }
    }
}
