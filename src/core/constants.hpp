#pragma once

// ── SSH options ─────────────────────────────────────────────
// Options passed to every spawned OpenSSH client.
constexpr const char* SSH_OPT_NO_HOSTKEY_CHECK = "StrictHostKeyChecking=no";
constexpr const char* SSH_OPT_BATCH_MODE       = "BatchMode=yes";
constexpr const char* SSH_PROGRAM              = "ssh";
constexpr const char* PASSWORD_HELPER_PROGRAM  = "sshpass";
constexpr const char* PASSWORD_HELPER_ENV      = "SSHPASS";

// ── Chunking ────────────────────────────────────────────────
// Each byte expands to four characters once escaped, so an 800-byte chunk
// becomes a 3200-character command line.
constexpr int DEFAULT_CHUNK_SIZE           = 800;
constexpr int NATIVE_OPENSSH_CHUNK_SIZE    = 500;
constexpr int MAX_CHUNK_SIZE               = 4096;  // 16 KiB command line, under every ARG_MAX
constexpr int DEFAULT_PROGRESS_INTERVAL    = 100;   // Report every N chunks
constexpr int NATIVE_PROGRESS_INTERVAL     = 50;

// ── Pacing ──────────────────────────────────────────────────
constexpr int CLIENT_CHUNK_DELAY_MS        = 10;
constexpr int HELPER_SETTLE_MS             = 2000;  // Wait after spawning sshpass
constexpr int HELPER_TRUNCATE_DELAY_MS     = 500;
constexpr int HELPER_CHUNK_DELAY_MS        = 10;
constexpr int PIPE_SETTLE_MS               = 3000;  // Wait after spawning ssh
constexpr int PIPE_TRUNCATE_DELAY_MS       = 1000;
constexpr int PIPE_CHUNK_DELAY_MS          = 10;
constexpr int NATIVE_CHUNK_DELAY_MS        = 50;

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CONNECT_TIMEOUT_SECS     = 30;
constexpr int SSH_CMD_TIMEOUT_SECS         = 300;   // Max time for a single remote command
constexpr int HELPER_EXIT_TIMEOUT_SECS     = 10;
constexpr int PIPE_EXIT_TIMEOUT_SECS       = 30;
constexpr int PIPE_QUERY_TIMEOUT_SECS      = 30;    // Wait for the byte-count reply

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE            = 4096;
