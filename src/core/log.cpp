#include "log.hpp"
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

std::mutex log_mutex;
std::string log_path;
std::atomic<bool> debug_enabled{false};

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    return ts;
}

void write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_path.empty()) {
        std::cerr << line << "\n";
        return;
    }
    std::ofstream out(log_path, std::ios::app);
    if (!out) {
        // Log file unusable; keep the message rather than drop it
        std::cerr << line << "\n";
        return;
    }
    out << line << "\n";
}

} // namespace

void set_bridge_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_path = path;
}

void set_bridge_log_debug(bool enabled) {
    debug_enabled.store(enabled);
}

void bridge_log(const std::string& msg) {
    write_line(fmt::format("[{}] {}", timestamp(), msg));
}

void bridge_log_warn(const std::string& msg) {
    write_line(fmt::format("[{}] WARN {}", timestamp(), msg));
}

void bridge_log_error(const std::string& msg) {
    write_line(fmt::format("[{}] ERROR {}", timestamp(), msg));
}

void bridge_log_debug(const std::string& msg) {
    if (!debug_enabled.load()) return;
    write_line(fmt::format("[{}] DEBUG {}", timestamp(), msg));
}

void bridge_log_command(const std::string& id, const std::string& cmd,
                        const CommandResult& r) {
    if (r.success) {
        bridge_log(fmt::format("[{}] {} ok stdout({})={}", id, cmd,
                               r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    } else {
        bridge_log_warn(fmt::format("[{}] {} failed ({}): {}", id, cmd,
                                    command_error_name(r.error), r.stderr_data));
    }
}
