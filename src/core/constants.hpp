#pragma once

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CMD_TIMEOUT_SECS       = 120;   // Max time for a single remote command
constexpr int SSH_UPLOAD_TIMEOUT_SECS    = 300;   // Max time for a staging upload
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;    // TCP connect + handshake
constexpr int SHELL_NEGOTIATE_SECS       = 30;    // Wait for first shell prompt
constexpr int POLL_INTERVAL_SECS         = 30;    // Queue poll interval
constexpr int CONNECT_TICK_MS            = 1000;  // Connecting{elapsed} tick

// ── Retry counts ────────────────────────────────────────────
constexpr int SSH_CONNECT_ATTEMPTS       = 3;     // Attempts before Failed
constexpr int SSH_RETRY_BACKOFF_MS       = 1000;  // First backoff, doubles each retry

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr int SSH_DRAIN_BUF_SIZE         = 4096;

// ── PTY geometry ────────────────────────────────────────────
// Wide enough that lpq lines never wrap inside the remote shell.
constexpr int SSH_PTY_COLS               = 512;
constexpr int SSH_PTY_ROWS               = 48;

// ── Defaults ────────────────────────────────────────────────
constexpr const char* DEFAULT_HOST        = "stu.comp.nus.edu.sg";
constexpr int DEFAULT_PORT                = 22;
constexpr const char* DEFAULT_STAGING_DIR = "/tmp";
constexpr int DEFAULT_HISTORY_DAYS        = 30;

// ── Remote commands ─────────────────────────────────────────
// Use fmt::format with these.
constexpr const char* LPQ_CMD  = "lpq -P {}";
constexpr const char* LPRM_CMD = "lprm -P {} {}";
