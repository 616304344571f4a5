#pragma once

#include <string>
#include <vector>
#include <functional>
#include <cstddef>
#include "constants.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Standard streams a capture can attach to.
enum class StreamName {
    Stdout,
    Stderr,
};

// "stdout" / "stderr"
const char* stream_label(StreamName stream);

// How output is intercepted.
enum class ConsoleMode {
    Wrap,       // std::ostream buffer proxy + terminal emulation
    WrapRaw,    // std::ostream buffer proxy, chunks passed through unparsed
    Redirect,   // OS descriptor redirected through a pipe + terminal emulation
    Off,
};

// Parse "wrap" / "wrap_raw" / "redirect" / "off". Returns Err on anything else.
Result<ConsoleMode> parse_console_mode(const std::string& name);
const char* console_mode_name(ConsoleMode mode);

// Receives one finalized line (no trailing newline).
using LineCallback = std::function<void(const std::string&)>;
using LineCallbacks = std::vector<LineCallback>;

// Tunables for a capture session.
struct ConsoleSettings {
    ConsoleMode mode = ConsoleMode::Wrap;
    std::size_t scrollback_rows = DEFAULT_SCROLLBACK_ROWS;   // eviction capacity H
    std::size_t pump_buffer = PUMP_READ_BUF_SIZE;           // bytes per pipe read
    int pump_poll_ms = PUMP_POLL_MS;                        // idle wake-up interval of the pump
};
