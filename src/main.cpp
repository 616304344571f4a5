#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <cstdlib>
#include <fmt/format.h>
#include "core/config.hpp"
#include "core/log.hpp"
#include "capture/console_capture.hpp"

void print_usage() {
    std::cerr << "Usage\n"
              << "    linecap run [--mode <m>] [--out <file>] <command...>\n"
              << "                          Run a shell command, capturing its stdout as lines\n"
              << "                          (mode: --mode, else console.mode, else redirect)\n"
              << "    linecap init          Write a default config to " << get_config_path().string() << "\n"
              << "    linecap config        Show the effective settings\n"
              << "\n"
              << "    linecap --version     Show version\n"
              << "    linecap --help        Show this help\n\n";
}

static int run_command(int argc, char** argv, const CaptureConfig& config) {
    // Child processes only show up at the descriptor level, so that is the
    // default unless the config names a mode; --mode overrides both.
    ConsoleSettings settings = config.console_for(ConsoleMode::Redirect);
    std::string out_path;
    std::string command;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--mode" && i + 1 < argc) {
            auto mode = parse_console_mode(argv[++i]);
            if (mode.is_err()) {
                std::cerr << mode.error << "\n";
                return 2;
            }
            settings.mode = mode.value;
        } else if (arg == "--out" && i + 1 < argc) {
            out_path = argv[++i];
        } else {
            if (!command.empty()) command += " ";
            command += arg;
        }
    }
    if (command.empty()) {
        print_usage();
        return 2;
    }

    std::vector<std::string> lines;
    auto capture = make_console_capture(StreamName::Stdout,
                                        {[&lines](const std::string& l) { lines.push_back(l); }},
                                        settings);
    if (capture.is_err()) {
        std::cerr << capture.error << "\n";
        return 1;
    }

    auto installed = capture.value->install();
    if (installed.is_err()) {
        std::cerr << installed.error << "\n";
        return 1;
    }
    int rc = std::system(command.c_str());
    auto removed = capture.value->uninstall();
    if (removed.is_err()) {
        std::cerr << removed.error << "\n";
        return 1;
    }

    if (!out_path.empty()) {
        std::ofstream out(out_path);
        if (!out) {
            std::cerr << "Cannot write " << out_path << "\n";
            return 1;
        }
        for (const auto& line : lines) out << line << "\n";
    }
    std::cerr << fmt::format("linecap: {} line(s) captured ({} mode, exit {})\n",
                             lines.size(), console_mode_name(settings.mode), rc);
    return rc == 0 ? 0 : 1;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 2;
    }

    std::string cmd = argv[1];
    if (cmd == "--version") {
        std::cout << "linecap version 0.1.0\n";
        return 0;
    } else if (cmd == "--help") {
        print_usage();
        return 0;
    } else if (cmd == "init") {
        auto r = create_default_config();
        if (r.is_err()) {
            std::cerr << r.error << "\n";
            return 1;
        }
        std::cout << "Config: " << get_config_path().string() << "\n";
        return 0;
    }

    auto config = CaptureConfig::load();
    if (config.is_err()) {
        std::cerr << config.error << "\n";
        return 1;
    }
    config.value.apply_logging();

    if (cmd == "config") {
        const auto& c = config.value.console();
        std::cout << fmt::format("source:       {}\n", config_exists() ? get_config_path().string() : "(defaults)")
                  << fmt::format("mode:         {}\n", console_mode_name(c.mode))
                  << fmt::format("scrollback:   {}\n", c.scrollback_rows)
                  << fmt::format("pump_buffer:  {}\n", c.pump_buffer)
                  << fmt::format("pump_poll_ms: {}\n", c.pump_poll_ms)
                  << fmt::format("log:          {}\n", config.value.log_enabled() ? linecap_log_path() : "off");
        return 0;
    } else if (cmd == "run") {
        return run_command(argc, argv, config.value);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    print_usage();
    return 2;
}
