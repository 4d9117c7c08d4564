#pragma once

#include <string>
#include <core/types.hpp>

// Route bridge_log() output to a file (append). Empty path = stderr.
void set_bridge_log_path(const std::string& path);

// Verbose lines (unassociated output, per-line routing) are dropped unless enabled.
void set_bridge_log_debug(bool enabled);

void bridge_log(const std::string& msg);
void bridge_log_warn(const std::string& msg);
void bridge_log_error(const std::string& msg);
void bridge_log_debug(const std::string& msg);

// Log a finished command with its (truncated) output.
void bridge_log_command(const std::string& id, const std::string& cmd,
                        const CommandResult& r);
