#include "stream_wrapper.hpp"
#include "install_stack.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <iostream>

namespace {

// Per-stream state shared by every StreamWrapper on that stream.
struct WrapChannel {
    InstallStack<StreamWrapper> stack;
    std::streambuf* real = nullptr;  // the stream's buffer before the first install
};

WrapChannel& channel_for(StreamName stream) {
    static WrapChannel out_channel;
    static WrapChannel err_channel;
    return stream == StreamName::Stdout ? out_channel : err_channel;
}

std::ostream& ostream_for(StreamName stream) {
    return stream == StreamName::Stdout ? std::cout : std::cerr;
}

} // namespace

// ── ProxyBuf ───────────────────────────────────────────────────

StreamWrapper::ProxyBuf::int_type StreamWrapper::ProxyBuf::overflow(int_type ch) {
    if (traits_type::eq_int_type(ch, traits_type::eof()))
        return traits_type::not_eof(ch);

    char c = traits_type::to_char_type(ch);
    if (target_ && traits_type::eq_int_type(target_->sputc(c), traits_type::eof()))
        return traits_type::eof();
    owner_.mirror(&c, 1);
    return ch;
}

std::streamsize StreamWrapper::ProxyBuf::xsputn(const char* s, std::streamsize n) {
    std::streamsize written = target_ ? target_->sputn(s, n) : n;
    if (written > 0) owner_.mirror(s, static_cast<std::size_t>(written));
    return written;
}

int StreamWrapper::ProxyBuf::sync() {
    return target_ ? target_->pubsync() : 0;
}

// ── StreamWrapper ──────────────────────────────────────────────

StreamWrapper::StreamWrapper(StreamName stream, LineCallbacks callbacks,
                             std::size_t scrollback_rows, Mirror mirror)
    : ConsoleCapture(stream),
      mode_(mirror),
      dispatcher_(fmt::format("wrap:{}", stream_label(stream)), std::move(callbacks)),
      emulator_([this](const std::string& line) { dispatcher_.dispatch(line); },
                scrollback_rows),
      proxy_(*this) {}

StreamWrapper::~StreamWrapper() {
    if (!installed()) return;
    auto r = uninstall();
    if (r.is_err())
        linecap_log(fmt::format("wrap:{}: uninstall on destruction failed: {}",
                                stream_label(stream()), r.error));
}

Result<void> StreamWrapper::install() {
    WrapChannel& ch = channel_for(stream());
    std::ostream& os = ostream_for(stream());

    std::lock_guard<std::mutex> lock(ch.stack.mutex());
    auto pushed = ch.stack.push(this);
    if (pushed.is_err()) return pushed;

    os.flush();
    if (!ch.real) ch.real = os.rdbuf();
    proxy_.set_target(ch.real);
    os.rdbuf(&proxy_);

    linecap_log(fmt::format("wrap:{}: installed (depth {})",
                            stream_label(stream()), ch.stack.depth()));
    return Result<void>::Ok();
}

Result<void> StreamWrapper::uninstall() {
    WrapChannel& ch = channel_for(stream());
    std::ostream& os = ostream_for(stream());

    {
        std::lock_guard<std::mutex> lock(ch.stack.mutex());
        auto removed = ch.stack.remove(this);
        if (removed.is_err()) return removed;

        os.flush();
        if (ch.stack.empty()) {
            os.rdbuf(ch.real);
            ch.real = nullptr;
        } else {
            os.rdbuf(&ch.stack.active()->proxy_);
        }

        linecap_log(fmt::format("wrap:{}: uninstalled (depth {})",
                                stream_label(stream()), ch.stack.depth()));
    }

    // Detached now; callbacks may write to the stream again.
    emulator_.flush();
    return Result<void>::Ok();
}

bool StreamWrapper::installed() const {
    WrapChannel& ch = channel_for(stream());
    std::lock_guard<std::mutex> lock(ch.stack.mutex());
    return ch.stack.contains(this);
}

void StreamWrapper::mirror(const char* data, std::size_t len) {
    if (mode_ == kRaw) {
        dispatcher_.dispatch(std::string(data, len));
        return;
    }
    emulator_.write(data, len);
}
