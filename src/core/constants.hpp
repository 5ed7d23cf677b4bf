#pragma once

#include <cstddef>
#include <cstdint>

// ── Connection pool ─────────────────────────────────────────
constexpr int POOL_MAX_CONNECTIONS_PER_HOST = 2;
constexpr int POOL_CHANNELS_PER_CONNECTION  = 8;
constexpr int POOL_CONNECT_TIMEOUT_MS       = 10000;
constexpr int POOL_ACQUIRE_TIMEOUT_MS       = 30000;
constexpr int POOL_IDLE_TIMEOUT_SECS        = 300;   // 5 min
constexpr int POOL_RETRY_ATTEMPTS           = 3;
constexpr int POOL_RETRY_BASE_MS            = 500;
constexpr int POOL_RETRY_CAP_MS             = 4000;
constexpr int POOL_REAPER_INTERVAL_MS       = 1000;

// ── Sessions ────────────────────────────────────────────────
constexpr int SESSION_IDLE_TIMEOUT_SECS     = 1800;  // 30 min
constexpr int SESSION_HISTORY_SIZE          = 100;
constexpr int SESSION_OUTPUT_QUEUE_CHUNKS   = 256;
constexpr int SSH_CMD_TIMEOUT_SECS          = 300;   // Max time for a single SSH command
constexpr std::size_t SESSION_MAX_OUTPUT_BYTES = 8 * 1024 * 1024;  // per stream, per command
constexpr int SHELL_DEFAULT_COLS            = 80;
constexpr int SHELL_DEFAULT_ROWS            = 24;

// ── Cache ───────────────────────────────────────────────────
constexpr int CACHE_STATUS_TTL_SECS         = 30;
constexpr int CACHE_CONTAINERS_TTL_SECS     = 300;   // 5 min

// ── Collector ───────────────────────────────────────────────
constexpr int COLLECTOR_INTERVAL_SECS       = 300;   // 5 min
constexpr int COLLECTOR_CONCURRENCY         = 4;
constexpr int COLLECTOR_CMD_TIMEOUT_SECS    = 15;
constexpr int HISTORY_RETENTION_DAYS        = 30;
constexpr int CLEANUP_INTERVAL_SECS         = 24 * 3600;

// ── Transfers ───────────────────────────────────────────────
constexpr int TRANSFER_MAX_GLOBAL           = 4;
constexpr int TRANSFER_MAX_PER_HOST         = 2;
constexpr std::size_t TRANSFER_CHUNK_SIZE   = 32 * 1024;
constexpr int TRANSFER_HISTORY_PER_HOST     = 100;
constexpr int TRANSFER_RETENTION_SECS       = 3600;
constexpr int SFTP_OP_TIMEOUT_SECS          = 30;

// ── Worker pool ─────────────────────────────────────────────
constexpr int WORKER_THREADS                = 8;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE             = 4096;
constexpr int SSH_POLL_INTERVAL_MS          = 10;
