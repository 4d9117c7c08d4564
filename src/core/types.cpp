#include "types.hpp"

const char* command_error_name(CommandError err) {
    switch (err) {
        case CommandError::None:           return "none";
        case CommandError::Timeout:        return "timeout";
        case CommandError::SessionCrashed: return "session_crashed";
        case CommandError::Malformed:      return "malformed";
        case CommandError::Shutdown:       return "shutdown";
        case CommandError::NotRunning:     return "not_running";
    }
    return "unknown";
}

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Starting:   return "starting";
        case SessionState::Running:    return "running";
        case SessionState::Crashed:    return "crashed";
        case SessionState::Restarting: return "restarting";
        case SessionState::Stopped:    return "stopped";
    }
    return "unknown";
}
