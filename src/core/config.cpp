#include "config.hpp"
#include "constants.hpp"
#include "log.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <cstdlib>
#include <fstream>

namespace fs = std::filesystem;

class ConfigBuilder {
public:
    static Result<CaptureConfig> build(const YAML::Node& root, const fs::path& source);

private:
    static Result<void> parse_console(const YAML::Node& node, CaptureConfig& config);
    static void parse_log(const YAML::Node& node, CaptureConfig& config);
};

Result<void> ConfigBuilder::parse_console(const YAML::Node& node, CaptureConfig& config) {
    ConsoleSettings& console = config.console_;
    if (node["mode"]) {
        auto mode = parse_console_mode(node["mode"].as<std::string>(""));
        if (mode.is_err()) return Result<void>::Err(mode.error);
        console.mode = mode.value;
        config.mode_configured_ = true;
    }

    long scrollback = node["scrollback"].as<long>(static_cast<long>(DEFAULT_SCROLLBACK_ROWS));
    if (scrollback < 1) {
        linecap_log(fmt::format("config: console.scrollback {} out of range, using {}",
                                scrollback, DEFAULT_SCROLLBACK_ROWS));
        scrollback = static_cast<long>(DEFAULT_SCROLLBACK_ROWS);
    }
    console.scrollback_rows = static_cast<std::size_t>(scrollback);

    long pump_buffer = node["pump_buffer"].as<long>(static_cast<long>(PUMP_READ_BUF_SIZE));
    if (pump_buffer < 1 || pump_buffer > static_cast<long>(PUMP_MAX_BUF_SIZE)) {
        linecap_log(fmt::format("config: console.pump_buffer {} out of range, using {}",
                                pump_buffer, PUMP_READ_BUF_SIZE));
        pump_buffer = static_cast<long>(PUMP_READ_BUF_SIZE);
    }
    console.pump_buffer = static_cast<std::size_t>(pump_buffer);

    int poll_ms = node["pump_poll_ms"].as<int>(PUMP_POLL_MS);
    if (poll_ms <= 0) {
        linecap_log(fmt::format("config: console.pump_poll_ms {} out of range, using {}",
                                poll_ms, PUMP_POLL_MS));
        poll_ms = PUMP_POLL_MS;
    }
    console.pump_poll_ms = poll_ms;

    return Result<void>::Ok();
}

void ConfigBuilder::parse_log(const YAML::Node& node, CaptureConfig& config) {
    config.log_enabled_ = node["enabled"].as<bool>(true);
    config.log_path_ = node["path"].as<std::string>("");
}

Result<CaptureConfig> ConfigBuilder::build(const YAML::Node& root, const fs::path& source) {
    CaptureConfig config;
    config.source_ = source;

    // Empty document
    if (!root || root.IsNull()) return Result<CaptureConfig>::Ok(config);
    if (!root.IsMap())
        return Result<CaptureConfig>::Err("Config root must be a mapping");

    try {
        if (root["console"] && root["console"].IsMap()) {
            auto parsed = parse_console(root["console"], config);
            if (parsed.is_err()) return Result<CaptureConfig>::Err(parsed.error);
        }
        if (root["log"] && root["log"].IsMap()) {
            parse_log(root["log"], config);
        }
    } catch (const YAML::Exception& e) {
        return Result<CaptureConfig>::Err("Invalid config value: " + std::string(e.what()));
    }

    return Result<CaptureConfig>::Ok(config);
}

// ── CaptureConfig ──────────────────────────────────────────────

Result<CaptureConfig> CaptureConfig::load() {
    return load_file(get_config_path());
}

Result<CaptureConfig> CaptureConfig::load_file(const fs::path& path) {
    if (!fs::exists(path)) return Result<CaptureConfig>::Ok(CaptureConfig{});

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        return ConfigBuilder::build(root, path);
    } catch (const YAML::Exception& e) {
        linecap_log(fmt::format("config: failed to parse {}: {}", path.string(), e.what()));
        return Result<CaptureConfig>::Err("Failed to parse " + path.string() + ": " + e.what());
    }
}

Result<CaptureConfig> CaptureConfig::parse(const std::string& yaml_text) {
    try {
        return ConfigBuilder::build(YAML::Load(yaml_text), fs::path());
    } catch (const YAML::Exception& e) {
        return Result<CaptureConfig>::Err("Failed to parse config: " + std::string(e.what()));
    }
}

ConsoleSettings CaptureConfig::console_for(ConsoleMode fallback) const {
    ConsoleSettings settings = console_;
    if (!mode_configured_) settings.mode = fallback;
    return settings;
}

void CaptureConfig::apply_logging() const {
    set_log_enabled(log_enabled_);
    if (!log_path_.empty()) set_log_path(log_path_);
}

// ── Paths ──────────────────────────────────────────────────────

fs::path get_config_path() {
    const char* env = std::getenv(CONFIG_ENV_VAR);
    if (env && *env) return fs::path(env);
    return platform::home_dir() / CONFIG_DIR_NAME / CONFIG_FILE_NAME;
}

bool config_exists() {
    return fs::exists(get_config_path());
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# linecap console capture settings

console:
  # mode: redirect      # wrap | wrap_raw | redirect | off; unset: wrap for the
                        # library, redirect for `linecap run`
  scrollback: 100       # rows that stay revisable before they are emitted
  pump_buffer: 4096     # bytes per pipe read (redirect mode)
  pump_poll_ms: 100     # pump wake-up interval while idle (redirect mode)

log:
  enabled: true
  # path: /tmp/linecap_debug.log
)";

    try {
        if (path.has_parent_path()) fs::create_directories(path.parent_path());
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}
