#include "event_log.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>

using json = nlohmann::json;

EventLogSink::EventLogSink(std::filesystem::path path)
    : path_(std::move(path)) {}

Result<void> EventLogSink::append(json event) {
    if (!event.is_object()) {
        return Result<void>::Err("event payload is not a JSON object");
    }
    event[EVENT_TS_FIELD] = epoch_seconds();

    std::string line;
    try {
        // Replace invalid UTF-8 rather than failing the whole record
        line = event.dump(-1, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        failed_++;
        bridge_log_error(fmt::format("event log: cannot serialize event: {}", e.what()));
        return Result<void>::Err(e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    std::ofstream f(path_, std::ios::app);
    if (f) {
        f << line << "\n";
        f.flush();
    }
    if (!f) {
        failed_++;
        std::string reason = fmt::format("event log: write to {} failed", path_.string());
        bridge_log_error(reason);
        return Result<void>::Err(reason);
    }

    written_++;
    auto from = event.find("from_id");
    bridge_log_debug(fmt::format("event logged ({})",
        from != event.end() && from->is_string() ? from->get<std::string>() : "unknown"));
    return Result<void>::Ok();
}

size_t EventLogSink::written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return written_;
}

size_t EventLogSink::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}
