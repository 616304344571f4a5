#pragma once

#include <memory>
#include <core/types.hpp>

// ConsoleCapture: one capture session on stdout or stderr.
//
// A capture is created detached. install() makes it the active capture of its
// stream; bytes written to the stream keep reaching the real destination and
// are also turned into finalized lines for the callbacks. uninstall() emits
// whatever is still buffered and hands the stream back to the capture that
// was active before (or to the real stream).
//
// Captures nest: installing B over A suspends A without flushing it, and
// installing A again resumes its virtual screen exactly where it left off.
class ConsoleCapture {
public:
    virtual ~ConsoleCapture() = default;

    ConsoleCapture(const ConsoleCapture&) = delete;
    ConsoleCapture& operator=(const ConsoleCapture&) = delete;

    // Err("usage: ...") if this capture is already the active one.
    virtual Result<void> install() = 0;

    // Err("usage: ...") if this capture is not installed.
    virtual Result<void> uninstall() = 0;

    // True while the capture sits anywhere in its stream's install stack.
    virtual bool installed() const = 0;

    StreamName stream() const { return stream_; }

protected:
    explicit ConsoleCapture(StreamName stream) : stream_(stream) {}

private:
    StreamName stream_;
};

// Build the capture selected by settings.mode:
//   wrap     -> StreamWrapper (emulated)
//   wrap_raw -> StreamWrapper (raw chunks)
//   redirect -> FdRedirect, Err("unsupported: ...") where descriptors cannot be redirected
//   off      -> Err
Result<std::unique_ptr<ConsoleCapture>> make_console_capture(
    StreamName stream, LineCallbacks callbacks, const ConsoleSettings& settings = {});
