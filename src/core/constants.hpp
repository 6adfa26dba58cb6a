#pragma once

#include <cstddef>
#include <cstdint>

// ── Presets ─────────────────────────────────────────────────
// Values in milliseconds unless noted.
constexpr int AGGRESSIVE_TIMEOUT_MS       = 1000;
constexpr int AGGRESSIVE_RETRY_DELAY_MS   = 250;
constexpr int AGGRESSIVE_RETRIES          = 2;
constexpr int AGGRESSIVE_MAX_WAIT_MS      = 15000;
constexpr int AGGRESSIVE_CONCURRENCY      = 8;

constexpr int CONSERVATIVE_TIMEOUT_MS     = 5000;
constexpr int CONSERVATIVE_RETRY_DELAY_MS = 1000;
constexpr int CONSERVATIVE_RETRIES        = 3;
constexpr int CONSERVATIVE_MAX_WAIT_MS    = 60000;
constexpr int CONSERVATIVE_CONCURRENCY    = 3;

// ── Probe backoff ───────────────────────────────────────────
constexpr int PROBE_BASE_DELAY_MS         = 500;
constexpr int PROBE_BACKOFF_CAP_MS        = 4000;
constexpr double PROBE_JITTER             = 0.20;  // ±20%
constexpr int PROBE_ROUND_SLACK_MS        = 250;   // added to connect_timeout per round

// ── Limits ──────────────────────────────────────────────────
constexpr int64_t MAX_DURATION_MS         = 24LL * 3600 * 1000;   // any timing setting
constexpr int64_t MAX_CREDENTIAL_TTL_SECS = 30LL * 24 * 3600;

// ── Transport ───────────────────────────────────────────────
constexpr int HTTP_READ_BUF_SIZE          = 8192;
constexpr size_t HTTP_MAX_HEADER_BYTES    = 64 * 1024;
constexpr size_t POOL_MAX_IDLE            = 4;      // idle keep-alive sockets per host

// ── Payload / credentials ───────────────────────────────────
constexpr int64_t MAX_PAYLOAD_BYTES       = 64LL * 1024 * 1024;  // 64 MB uncompressed
constexpr int CREDENTIAL_TTL_SECS         = 3600;
constexpr int PAYLOAD_ENTRY_MTIME         = 0;     // fixed for byte-identical archives

// ── Post-install shell ──────────────────────────────────────
constexpr int SSH_DEFAULT_PORT            = 22;
constexpr int SSH_CMD_TIMEOUT_SECS        = 60;
constexpr int SSH_READ_BUF_SIZE           = 4096;

// ── Local paths ─────────────────────────────────────────────
constexpr const char* RPROV_HOME_DIR      = ".rprov";
constexpr const char* CONFIG_FILE_NAME    = "config.yaml";
constexpr const char* CACHE_FILE_NAME     = "credentials.yaml";

// ── CLI ─────────────────────────────────────────────────────
constexpr const char* RPROV_VERSION       = "0.4.0";
constexpr const char* DEFAULT_PORTS       = "22,23,21";   // ssh, telnet, ftp
