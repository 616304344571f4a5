#pragma once

#include <cstddef>

// ── Terminal emulation ──────────────────────────────────────
constexpr std::size_t DEFAULT_SCROLLBACK_ROWS = 100;    // rows kept revisable before eviction
constexpr std::size_t CSI_MAX_PARAMS          = 16;     // extra parameters are ignored
constexpr int CSI_MAX_PARAM_VALUE             = 100000; // clamp for absurd counts
constexpr std::size_t CSI_MAX_SEQ_LEN         = 64;     // longer sequences are abandoned
constexpr std::size_t MAX_CURSOR_COLUMN       = 1024;   // CSI C stops here unless the row is already longer

// ── Descriptor pump ─────────────────────────────────────────
constexpr std::size_t PUMP_READ_BUF_SIZE      = 4096;
constexpr std::size_t PUMP_MAX_BUF_SIZE       = 1 << 20;
constexpr int PUMP_POLL_MS                    = 100;    // wake-up interval to observe stop requests

// ── Config / log locations ──────────────────────────────────
constexpr const char* CONFIG_DIR_NAME         = ".linecap";
constexpr const char* CONFIG_FILE_NAME        = "config.yaml";
constexpr const char* CONFIG_ENV_VAR          = "LINECAP_CONFIG";
constexpr const char* DEBUG_LOG_NAME          = "linecap_debug.log";
