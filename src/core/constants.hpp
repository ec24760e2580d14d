#pragma once

#include <cstdint>

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CMD_TIMEOUT_SECS       = 30;    // Default bound for a single command
constexpr int SSH_CMD_TIMEOUT_MAX_SECS   = 300;
constexpr int SSH_STAGING_TIMEOUT_SECS   = 120;   // pct push/pull of a staged file
constexpr int SSH_LIFECYCLE_TIMEOUT_SECS = 120;   // pct start/stop
constexpr int SSH_CHANNEL_OPEN_SECS      = 30;    // Opening exec channels / SFTP
constexpr int SSH_KEEPALIVE_SECS         = 30;
constexpr int SSH_POLL_INTERVAL_MS       = 10;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr int SFTP_XFER_BUF_SIZE         = 32768;

// ── Container ids ───────────────────────────────────────────
constexpr long VMID_MIN                  = 100;
constexpr long VMID_MAX                  = 999999999;

// ── Input limits ────────────────────────────────────────────
constexpr int MAX_PATH_LENGTH            = 4096;
constexpr int MAX_COMMAND_LENGTH         = 10000;

// ── Defaults ────────────────────────────────────────────────
constexpr int64_t DEFAULT_MAX_FILE_SIZE  = 10LL * 1024 * 1024;   // 10 MB
constexpr int DEFAULT_CHARACTER_LIMIT    = 25000;
constexpr const char* DEFAULT_STAGING_PREFIX = "/tmp/pxrelay-";
constexpr const char* DEFAULT_PERMISSIONS    = "644";

// Space reserved for keys and metadata when truncating structured output.
constexpr int STRUCTURED_OVERHEAD_CHARS  = 500;
constexpr int STRUCTURED_MIN_DATA_CHARS  = 1000;
