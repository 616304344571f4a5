#include "fd_redirect.hpp"
#include "redirect_channel.hpp"
#include <core/log.hpp>
#include <platform/descriptor.hpp>
#include <fmt/format.h>

Result<std::unique_ptr<FdRedirect>> FdRedirect::create(StreamName stream,
                                                       LineCallbacks callbacks,
                                                       const ConsoleSettings& settings) {
    if (!platform::supports_fd_redirect()) {
        return Result<std::unique_ptr<FdRedirect>>::Err(
            "unsupported: descriptor-level redirection is not available on this platform");
    }
    return Result<std::unique_ptr<FdRedirect>>::Ok(
        std::unique_ptr<FdRedirect>(new FdRedirect(stream, std::move(callbacks), settings)));
}

FdRedirect::FdRedirect(StreamName stream, LineCallbacks callbacks,
                       const ConsoleSettings& settings)
    : ConsoleCapture(stream),
      settings_(settings),
      dispatcher_(fmt::format("redirect:{}", stream_label(stream)), std::move(callbacks)),
      emulator_([this](const std::string& line) { dispatcher_.dispatch(line); },
                settings.scrollback_rows) {}

FdRedirect::~FdRedirect() {
    if (!installed()) return;
    auto r = uninstall();
    if (r.is_err())
        linecap_log(fmt::format("redirect:{}: uninstall on destruction failed: {}",
                                stream_label(stream()), r.error));
}

Result<void> FdRedirect::install() {
    return RedirectChannel::for_stream(stream()).attach(this, settings_);
}

Result<void> FdRedirect::uninstall() {
    auto detached = RedirectChannel::for_stream(stream()).detach(this);
    if (detached.is_err()) return detached;

    // Out of the stack: the pump no longer touches this emulator.
    emulator_.flush();
    return Result<void>::Ok();
}

bool FdRedirect::installed() const {
    return RedirectChannel::for_stream(stream()).attached(this);
}

void FdRedirect::mirror(const char* data, std::size_t len) {
    emulator_.write(data, len);
}
