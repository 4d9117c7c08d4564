#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Serialization of caller commands into the managed program's line protocol.
//
// The program splits its input line on whitespace itself and honours double
// quotes, but keeps single quotes as literal data. An argument containing
// whitespace or a quote character is therefore sent as "..." with embedded
// double quotes backslash-escaped.

// Quote one argument (returned unchanged when no quoting is needed).
std::string quote_argument(const std::string& arg);

// Join quoted arguments into a single line, without the line terminator.
Result<std::string> build_command_line(const std::vector<std::string>& args);

// Text must be non-empty and must not contain a line terminator or NUL.
Result<void> validate_command_text(const std::string& text);
