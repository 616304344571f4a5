#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Capture settings read from YAML:
//
//   console:
//     mode: wrap            # wrap | wrap_raw | redirect | off (default wrap)
//     scrollback: 100
//     pump_buffer: 4096
//     pump_poll_ms: 100
//   log:
//     enabled: true
//     path: /tmp/linecap_debug.log
//
// Every key is optional. Out-of-range numbers fall back to the defaults.
class CaptureConfig {
public:
    // Load from get_config_path(). A missing file yields the defaults.
    static Result<CaptureConfig> load();

    // Load from an explicit file. A missing file yields the defaults.
    static Result<CaptureConfig> load_file(const fs::path& path);

    // Parse YAML text directly.
    static Result<CaptureConfig> parse(const std::string& yaml_text);

    // Accessors
    const ConsoleSettings& console() const { return console_; }
    // True when the source named console.mode explicitly.
    bool mode_configured() const { return mode_configured_; }
    // console() with `fallback` as the mode unless console.mode was given.
    ConsoleSettings console_for(ConsoleMode fallback) const;
    bool log_enabled() const { return log_enabled_; }
    const std::string& log_path() const { return log_path_; }
    const fs::path& source() const { return source_; }

    // Route linecap_log() according to the log section.
    void apply_logging() const;

public:
    CaptureConfig() = default;

private:
    ConsoleSettings console_;
    bool mode_configured_ = false;
    bool log_enabled_ = true;
    std::string log_path_;   // empty: keep the default location
    fs::path source_;        // file the settings came from, empty for defaults/text

    friend class ConfigBuilder;
};

// $LINECAP_CONFIG if set, else ~/.linecap/config.yaml
fs::path get_config_path();
bool config_exists();

// Write a commented default config to `path` unless one already exists.
Result<void> create_default_config(const fs::path& path = get_config_path());
