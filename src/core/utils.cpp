#include "utils.hpp"
#include <chrono>
#include <ctime>
#include <random>
#include <mutex>

std::string to_iso(std::time_t t) {
    if (t == 0) return "";
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

double epoch_seconds() {
    auto now = std::chrono::system_clock::now();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count();
    return static_cast<double>(us) / 1e6;
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string random_hex_id(size_t length) {
    static std::mutex rng_mutex;
    static std::mt19937_64 rng(std::random_device{}());
    static const char HEX[] = "0123456789abcdef";

    std::uniform_int_distribution<int> dist(0, 15);
    std::string id;
    id.reserve(length);
    std::lock_guard<std::mutex> lock(rng_mutex);
    for (size_t i = 0; i < length; i++) {
        id += HEX[dist(rng)];
    }
    return id;
}

std::string substitute(std::string text, const std::string& key, const std::string& value) {
    std::string token = "{" + key + "}";
    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
    return text;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}
