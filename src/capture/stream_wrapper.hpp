#pragma once

#include <cstddef>
#include <streambuf>
#include "console_capture.hpp"
#include "line_dispatcher.hpp"
#include <emulator/terminal_emulator.hpp>

// StreamWrapper: captures what the program writes through std::cout / std::cerr.
//
// install() swaps the stream's buffer for a proxy that forwards every byte
// unchanged to the stream's original buffer and mirrors it into this
// wrapper's emulator. Output that bypasses the C++ stream (printf, write(2),
// child processes) is not seen; use FdRedirect for that.
//
// No locking on the write path: concurrent writers need the same external
// synchronisation the unwrapped stream would need.
class StreamWrapper : public ConsoleCapture {
public:
    enum Mirror {
        kEmulated,  // bytes go through a TerminalEmulator, callbacks get finalized lines
        kRaw,       // every chunk written is handed to the callbacks as-is
    };

    StreamWrapper(StreamName stream, LineCallbacks callbacks,
                  std::size_t scrollback_rows = DEFAULT_SCROLLBACK_ROWS,
                  Mirror mirror = kEmulated);
    ~StreamWrapper() override;

    Result<void> install() override;
    Result<void> uninstall() override;
    bool installed() const override;

    const TerminalEmulator& emulator() const { return emulator_; }
    const LineDispatcher& dispatcher() const { return dispatcher_; }

private:
    // Unbuffered: every put reaches overflow()/xsputn() immediately.
    class ProxyBuf : public std::streambuf {
    public:
        explicit ProxyBuf(StreamWrapper& owner) : owner_(owner) {}
        void set_target(std::streambuf* target) { target_ = target; }

    protected:
        int_type overflow(int_type ch) override;
        std::streamsize xsputn(const char* s, std::streamsize n) override;
        int sync() override;

    private:
        StreamWrapper& owner_;
        std::streambuf* target_ = nullptr;
    };

    void mirror(const char* data, std::size_t len);

    Mirror mode_;
    LineDispatcher dispatcher_;
    TerminalEmulator emulator_;
    ProxyBuf proxy_;
};
