#pragma once

#include <string>
#include <vector>
#include <ctime>

// Format a time_t as an ISO 8601 local timestamp. Returns "" for 0.
std::string to_iso(std::time_t t);

// Seconds since the Unix epoch with sub-second precision.
double epoch_seconds();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Random lowercase hex identifier of the given length.
std::string random_hex_id(size_t length = 8);

// Replace every "{key}" occurrence in text.
std::string substitute(std::string text, const std::string& key, const std::string& value);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Join lines with '\n' (no trailing newline).
std::string join_lines(const std::vector<std::string>& lines);
