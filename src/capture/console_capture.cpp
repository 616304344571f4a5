#include "console_capture.hpp"
#include "stream_wrapper.hpp"
#include "fd_redirect.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

using CaptureResult = Result<std::unique_ptr<ConsoleCapture>>;

CaptureResult make_console_capture(StreamName stream, LineCallbacks callbacks,
                                   const ConsoleSettings& settings) {
    switch (settings.mode) {
    case ConsoleMode::Wrap:
        return CaptureResult::Ok(std::make_unique<StreamWrapper>(
            stream, std::move(callbacks), settings.scrollback_rows, StreamWrapper::kEmulated));

    case ConsoleMode::WrapRaw:
        return CaptureResult::Ok(std::make_unique<StreamWrapper>(
            stream, std::move(callbacks), settings.scrollback_rows, StreamWrapper::kRaw));

    case ConsoleMode::Redirect: {
        auto redirect = FdRedirect::create(stream, std::move(callbacks), settings);
        if (redirect.is_err()) {
            linecap_log(fmt::format("{}: redirect unavailable: {}",
                                    stream_label(stream), redirect.error));
            return CaptureResult::Err(redirect.error);
        }
        return CaptureResult::Ok(std::move(redirect.value));
    }

    case ConsoleMode::Off:
        break;
    }
    return CaptureResult::Err(fmt::format("Console capture is disabled for {} (mode: {})",
                                          stream_label(stream), console_mode_name(settings.mode)));
}
