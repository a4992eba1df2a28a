#pragma once

// ── Connection ──────────────────────────────────────────────
constexpr int DEFAULT_SSH_PORT           = 22;
constexpr int DIAL_TIMEOUT_SECS          = 10;    // TCP connect + SSH handshake
constexpr int SSH_EAGAIN_SLEEP_MS        = 10;    // Backoff between non-blocking libssh2 retries

// ── PTY ─────────────────────────────────────────────────────
// Geometry and modes requested for every command session.
constexpr const char* PTY_TERM           = "xterm";
constexpr int PTY_WIDTH_COLS             = 80;
constexpr int PTY_HEIGHT_ROWS            = 40;
constexpr unsigned PTY_BAUD              = 14400;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;

// ── Logging ─────────────────────────────────────────────────
constexpr int LOG_OUTPUT_PREVIEW_BYTES   = 500;

// ── Remote protocol ─────────────────────────────────────────
// Text sudo prints before reading a password from the terminal.
constexpr const char* SUDO_PROMPT_MARKER = "[sudo] password for";
constexpr const char* SUDO_PREFIX        = "sudo ";
constexpr const char* RESOURCE_ID_SEPARATOR = "-";

// ── Config ──────────────────────────────────────────────────
constexpr const char* CONFIG_DIR_NAME    = ".rexec";
constexpr const char* CONFIG_FILE_NAME   = "config.yaml";
constexpr const char* DEBUG_LOG_NAME     = "rexec_debug.log";
