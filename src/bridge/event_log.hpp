#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include <core/types.hpp>

// Append-only JSON-lines record of asynchronous events.
// Each line is the event object with a receipt timestamp ("ts", epoch
// seconds) injected at write time.
class EventLogSink {
public:
    explicit EventLogSink(std::filesystem::path path);

    // Append one event. Failures are logged and returned, never thrown.
    Result<void> append(nlohmann::json event);

    const std::filesystem::path& path() const { return path_; }

    size_t written() const;
    size_t failed() const;

private:
    std::filesystem::path path_;
    mutable std::mutex mutex_;
    size_t written_ = 0;
    size_t failed_ = 0;
};
