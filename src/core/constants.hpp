#pragma once

#include <cstdint>

// ── Version ─────────────────────────────────────────────────
constexpr const char* MRILABS_VERSION = "0.1.0";

// ── Timeouts ────────────────────────────────────────────────
constexpr int LOCK_TIMEOUT_SECS         = 10;    // Bounded wait on a store lock file
constexpr int LOCK_RETRY_MS             = 25;    // Poll interval while waiting on a lock
constexpr int TICK_INTERVAL_MS          = 500;   // Scheduler due-time evaluation interval
constexpr int SCPI_TIMEOUT_MS           = 2000;  // Instrument command/response timeout
constexpr int SCPI_CONNECT_TIMEOUT_MS   = 1000;  // TCP connect timeout while probing

// ── Instruments ─────────────────────────────────────────────
constexpr int SCPI_RAW_PORT             = 5025;  // LXI raw socket port
constexpr int SCPI_READ_BUF_SIZE        = 4096;
constexpr int OSCILLOSCOPE_BUFFER_SIZE  = 512;   // Samples kept per scope channel
constexpr int MOCK_SCOPE_SAMPLES        = 100;   // Samples per simulated readout
constexpr const char* IDN_QUERY         = "*IDN?";
constexpr const char* DG4202_IDN        = "DG4202";
constexpr const char* EDUX1002A_IDN     = "EDUX1002A";

// ── Persisted files ─────────────────────────────────────────
constexpr const char* STATE_FILE        = "state.json";
constexpr const char* JOBS_FILE         = "jobs.json";
constexpr const char* ARCHIVE_FILE      = "archive.json";
constexpr const char* LOCK_SUFFIX       = ".lock";
constexpr const char* BACKUP_SUFFIX     = ".bak";
constexpr const char* LAST_ALIVE_SUFFIX = "_last_alive";

// ── Display ─────────────────────────────────────────────────
constexpr const char* NOT_AVAILABLE     = "N/A";
