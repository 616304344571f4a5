#pragma once

#include <memory>
#include "console_capture.hpp"
#include "line_dispatcher.hpp"
#include <emulator/terminal_emulator.hpp>

class RedirectChannel;

// FdRedirect: captures everything written to descriptor 1 or 2.
//
// The descriptor is pointed at a pipe whose read end is pumped by a
// background thread (see RedirectChannel). The pump copies every byte to the
// original descriptor, so the console still shows it, and feeds it to the
// active FdRedirect's emulator. Unlike StreamWrapper this sees printf(),
// raw write(2) calls and child processes that inherit the descriptor.
//
// Callbacks run on the pump thread while the channel lock is held: they must
// not block, and must not write enough to the captured stream to fill the pipe.
// installed() may be called from a callback; install() and uninstall() of a
// capture on the same stream may not, they wait for that lock.
class FdRedirect : public ConsoleCapture {
public:
    // Err("unsupported: ...") where descriptors cannot be redirected.
    static Result<std::unique_ptr<FdRedirect>> create(StreamName stream,
                                                      LineCallbacks callbacks,
                                                      const ConsoleSettings& settings = {});
    ~FdRedirect() override;

    // First install on a stream redirects the descriptor and starts the pump.
    Result<void> install() override;

    // Last uninstall on a stream stops the pump, drains the pipe and restores
    // the descriptor before the emulator is flushed.
    Result<void> uninstall() override;

    bool installed() const override;

    // Only stable while this capture is not installed.
    const TerminalEmulator& emulator() const { return emulator_; }
    const LineDispatcher& dispatcher() const { return dispatcher_; }

private:
    FdRedirect(StreamName stream, LineCallbacks callbacks, const ConsoleSettings& settings);

    // Called by the channel with its lock held.
    void mirror(const char* data, std::size_t len);
    friend class RedirectChannel;

    ConsoleSettings settings_;
    LineDispatcher dispatcher_;
    TerminalEmulator emulator_;
};
