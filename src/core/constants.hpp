#pragma once

#include <cstddef>

// ── Version ─────────────────────────────────────────────────
constexpr const char* MCBRIDGE_VERSION = "0.4.0";

// ── Managed process ─────────────────────────────────────────
// Settings file written by the web application, read at every session start.
constexpr const char* SETTINGS_FILE_NAME   = ".webui_settings.json";
constexpr const char* EVENT_LOG_SUFFIX     = ".adverts.jsonl";
constexpr const char* EVENT_TYPE_FIELD     = "payload_typename";
constexpr const char* EVENT_TS_FIELD       = "ts";
constexpr const char* DEFAULT_CONFIG_PATH  = "/config/mcbridge.yaml";
constexpr const char* RECV_COMMAND         = "recv";
constexpr int DEFAULT_HTTP_PORT            = 5001;

// ── Timing ──────────────────────────────────────────────────
constexpr int DEFAULT_CMD_TIMEOUT_SECS  = 10;    // Caller deadline when none is given
constexpr int RECV_TIMEOUT_SECS         = 60;    // recv waits for radio traffic
constexpr int MAX_CMD_TIMEOUT_SECS      = 24 * 60 * 60;  // Longest deadline a caller may ask for
constexpr int QUIESCENCE_MS             = 300;   // Idle time that ends a command's output
constexpr int HEALTH_CHECK_SECS         = 5;     // Liveness poll interval
constexpr int RESTART_BACKOFF_SECS      = 10;    // Delay after a failed restart
constexpr int SHUTDOWN_GRACE_MS         = 5000;  // SIGTERM → SIGKILL window
constexpr int INIT_SETTLE_MS            = 500;   // Let the program open the device
constexpr int INIT_DRAIN_MAX_MS         = 3000;  // Upper bound on init output drain
constexpr int RECORD_FLUSH_MS           = 150;   // Idle time that releases a partial record
constexpr int STDERR_POLL_MS            = 200;
constexpr int STDIN_POLL_MS             = 100;   // Re-check for cancellation while stdin is full
constexpr int HTTP_ACCEPT_POLL_MS       = 500;
constexpr int HTTP_READ_TIMEOUT_MS      = 10000;

// ── Buffers and bounds ──────────────────────────────────────
constexpr int PIPE_READ_BUF_SIZE        = 4096;
constexpr int HTTP_READ_BUF_SIZE        = 8192;
constexpr size_t HTTP_MAX_REQUEST_BYTES = 1024 * 1024;
constexpr size_t RECORD_MAX_LINES       = 256;
constexpr size_t RECORD_MAX_BYTES       = 64 * 1024;
constexpr int HTTP_LISTEN_BACKLOG       = 16;
