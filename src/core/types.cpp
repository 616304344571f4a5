#include "types.hpp"

const char* stream_label(StreamName stream) {
    switch (stream) {
        case StreamName::Stdout: return "stdout";
        case StreamName::Stderr: return "stderr";
    }
    return "?";
}

Result<ConsoleMode> parse_console_mode(const std::string& name) {
    if (name == "wrap")     return Result<ConsoleMode>::Ok(ConsoleMode::Wrap);
    if (name == "wrap_raw") return Result<ConsoleMode>::Ok(ConsoleMode::WrapRaw);
    if (name == "redirect") return Result<ConsoleMode>::Ok(ConsoleMode::Redirect);
    if (name == "off")      return Result<ConsoleMode>::Ok(ConsoleMode::Off);
    return Result<ConsoleMode>::Err("Unknown console mode: " + name);
}

const char* console_mode_name(ConsoleMode mode) {
    switch (mode) {
        case ConsoleMode::Wrap:     return "wrap";
        case ConsoleMode::WrapRaw:  return "wrap_raw";
        case ConsoleMode::Redirect: return "redirect";
        case ConsoleMode::Off:      return "off";
    }
    return "?";
}
