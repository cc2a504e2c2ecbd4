#pragma once

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_OK                 = 0;
constexpr int EXIT_VALIDATION_FAILURE = 1;     // git or resource gate
constexpr int EXIT_TASK_FAILURE       = 2;     // task crash/timeout, mapping failure
constexpr int EXIT_TRANSFER_FAILURE   = 3;     // PARTIAL
constexpr int EXIT_ABORTED            = 130;   // 128 + SIGINT

// ── Timeouts ────────────────────────────────────────────────
constexpr int TERMINATE_GRACE_MS       = 2000;  // SIGTERM -> SIGKILL window
constexpr int GIT_CMD_TIMEOUT_SECS     = 30;
constexpr int MONITOR_MIN_INTERVAL_MS  = 50;    // floor for background sampling

// ── Retry defaults ──────────────────────────────────────────
constexpr int DEFAULT_MAX_ATTEMPTS     = 5;
constexpr int DEFAULT_BASE_BACKOFF_MS  = 500;
constexpr int DEFAULT_MAX_BACKOFF_MS   = 30000;
constexpr int DEFAULT_JITTER_MAX_MS    = 250;

// ── Transfer ────────────────────────────────────────────────
constexpr int DEFAULT_TRANSFER_WORKERS = 4;
constexpr int MAX_TRANSFER_WORKERS     = 64;
constexpr int COPY_BUF_SIZE            = 1 << 16;

// ── State layout (inside each session directory) ────────────
constexpr const char* STATE_DIR_NAME     = ".expctl";
constexpr const char* MANIFEST_FILE_NAME = "session_manifest.yaml";
constexpr const char* LEDGER_FILE_NAME   = "transfer_ledger.yaml";
constexpr const char* SESSION_LOG_NAME   = "launcher.log";
constexpr const char* TASK_LOG_NAME      = "task.log";

// Session directory name: fmt::format(SESSION_DIR_FORMAT, subject, timestamp)
constexpr const char* SESSION_DIR_FORMAT = "{}_{}";
