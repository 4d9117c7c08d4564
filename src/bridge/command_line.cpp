#include "command_line.hpp"
#include <fmt/format.h>

static bool needs_quoting(const std::string& arg) {
    if (arg.empty()) return true;
    for (char c : arg) {
        if (c == ' ' || c == '\t' || c == '\v' || c == '\f' || c == '"' || c == '\'')
            return true;
    }
    return false;
}

std::string quote_argument(const std::string& arg) {
    if (!needs_quoting(arg)) return arg;

    std::string quoted;
    quoted.reserve(arg.size() + 4);
    quoted += '"';
    for (char c : arg) {
        if (c == '"') quoted += '\\';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

Result<void> validate_command_text(const std::string& text) {
    if (text.empty()) {
        return Result<void>::Err("empty command");
    }
    for (size_t i = 0; i < text.size(); i++) {
        char c = text[i];
        if (c == '\n' || c == '\r') {
            return Result<void>::Err(fmt::format("line terminator at offset {}", i));
        }
        if (c == '\0') {
            return Result<void>::Err(fmt::format("NUL byte at offset {}", i));
        }
    }
    return Result<void>::Ok();
}

Result<std::string> build_command_line(const std::vector<std::string>& args) {
    if (args.empty()) {
        return Result<std::string>::Err("empty command");
    }

    std::string line;
    for (size_t i = 0; i < args.size(); i++) {
        auto check = validate_command_text(args[i].empty() ? std::string("\"\"") : args[i]);
        if (check.is_err()) {
            return Result<std::string>::Err(fmt::format("argument {}: {}", i, check.error));
        }
        if (i > 0) line += ' ';
        line += quote_argument(args[i]);
    }
    return Result<std::string>::Ok(line);
}
