#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <cstdint>
#include "constants.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Why a command did not produce output
enum class CommandError {
    None,
    Timeout,          // no quiescence before the caller's deadline
    SessionCrashed,   // managed process died while queued or in flight
    Malformed,        // text cannot be sent as a single protocol line
    Shutdown,         // bridge stopping
    NotRunning,       // no session has ever come up
};

const char* command_error_name(CommandError err);

// Managed-process command execution result
struct CommandResult {
    bool success = false;
    std::string stdout_data;
    std::string stderr_data;
    CommandError error = CommandError::None;

    int returncode() const { return success ? 0 : -1; }
    bool failed() const { return !success; }

    static CommandResult ok(std::string output) {
        return CommandResult{true, std::move(output), "", CommandError::None};
    }

    static CommandResult fail(CommandError err, std::string reason) {
        return CommandResult{false, "", std::move(reason), err};
    }
};

// Session lifecycle as seen by the supervisor
enum class SessionState {
    Starting,
    Running,
    Crashed,
    Restarting,
    Stopped,
};

const char* session_state_name(SessionState state);

// Configuration structures
struct HttpConfig {
    std::string host = "0.0.0.0";
    int port = DEFAULT_HTTP_PORT;
};

struct TimeoutConfig {
    int default_secs = DEFAULT_CMD_TIMEOUT_SECS;
    int recv_secs = RECV_TIMEOUT_SECS;
};

struct BridgeConfig {
    std::string serial_port = "/dev/ttyUSB0";
    std::string config_dir = "/config";
    std::string device_name = "meshtastic";

    std::string program = "meshcli";
    std::vector<std::string> program_args = {"-s", "{serial_port}"};

    HttpConfig http;
    TimeoutConfig timeouts;

    int quiescence_ms = QUIESCENCE_MS;
    int health_check_secs = HEALTH_CHECK_SECS;
    int restart_backoff_secs = RESTART_BACKOFF_SECS;
    int shutdown_grace_ms = SHUTDOWN_GRACE_MS;
    int init_settle_ms = INIT_SETTLE_MS;

    std::vector<std::string> event_types = {"ADVERT"};
    std::vector<std::string> init_commands = {
        "set json_log_rx on",
        "set print_adverts on",
        "msgs_subscribe",
    };
    // settings-file toggle name -> command issued when the toggle is true
    std::map<std::string, std::string> toggle_commands = {
        {"manual_add_contacts", "set manual_add_contacts on"},
    };

    std::string log_file;                 // empty = stderr
    bool log_debug = false;
};
