#include "terminal_emulator.hpp"
#include <algorithm>

static constexpr unsigned char ESC = 0x1b;
static constexpr unsigned char BEL = 0x07;

TerminalEmulator::TerminalEmulator(LineSink sink, std::size_t scrollback_rows)
    : sink_(std::move(sink)),
      scrollback_rows_((std::max)(scrollback_rows, std::size_t{1})) {
    grid_.emplace_back();
}

// ── Input ──────────────────────────────────────────────────────

void TerminalEmulator::write(const char* data, std::size_t len) {
    for (std::size_t i = 0; i < len; i++)
        feed(static_cast<unsigned char>(data[i]));
}

void TerminalEmulator::feed(unsigned char c) {
    switch (state_) {
    case ParseState::Ground:
        feed_ground(c);
        return;

    case ParseState::Escape:
        if (c == '[') {
            seq_ += static_cast<char>(c);
            state_ = ParseState::Csi;
        } else if (c == ']') {
            state_ = ParseState::Osc;
        } else if (c == ESC) {
            seq_.assign(1, static_cast<char>(ESC));
        } else {
            // Two-byte escape (ESC 7, ESC =, ...): no effect
            state_ = ParseState::Ground;
        }
        return;

    case ParseState::Csi:
        if (c >= 0x40 && c <= 0x7e) {
            seq_ += static_cast<char>(c);
            state_ = ParseState::Ground;
            dispatch_csi(static_cast<char>(c));
        } else if (c >= 0x20 && c <= 0x3f && seq_.size() < CSI_MAX_SEQ_LEN) {
            seq_ += static_cast<char>(c);
        } else {
            // Malformed or runaway sequence: drop it and treat the byte as ground input
            state_ = ParseState::Ground;
            feed_ground(c);
        }
        return;

    case ParseState::Osc:
        if (c == BEL) state_ = ParseState::Ground;
        else if (c == ESC) state_ = ParseState::OscEscape;
        return;

    case ParseState::OscEscape:
        if (c == '\\') {
            state_ = ParseState::Ground;
        } else {
            // ESC terminated the string and starts a new sequence
            seq_.assign(1, static_cast<char>(ESC));
            state_ = ParseState::Escape;
            feed(c);
        }
        return;
    }
}

void TerminalEmulator::feed_ground(unsigned char c) {
    if (codepoint_need_ > 0) {
        if ((c & 0xc0) == 0x80) {
            codepoint_ += static_cast<char>(c);
            if (--codepoint_need_ == 0) {
                put_glyph(codepoint_);
                codepoint_.clear();
            }
            return;
        }
        flush_partial_codepoint();
    }

    if (c == ESC) {
        seq_.assign(1, static_cast<char>(ESC));
        state_ = ParseState::Escape;
    } else if (c == '\r') {
        carriage_return();
    } else if (c == '\n') {
        line_feed();
    } else if (c == '\t') {
        put_glyph(std::string(1, '\t'));
    } else if (c < 0x20 || c == 0x7f) {
        // Other C0 controls are dropped
    } else if (c < 0x80) {
        put_glyph(std::string(1, static_cast<char>(c)));
    } else if (c >= 0xc0 && c < 0xf8) {
        codepoint_.assign(1, static_cast<char>(c));
        codepoint_need_ = c >= 0xf0 ? 3 : (c >= 0xe0 ? 2 : 1);
    } else {
        // Stray continuation or invalid lead byte: keep it as its own cell
        put_glyph(std::string(1, static_cast<char>(c)));
    }
}

// A multi-byte sequence cut short is stored as-is so no input byte is lost.
void TerminalEmulator::flush_partial_codepoint() {
    std::string partial;
    partial.swap(codepoint_);
    codepoint_need_ = 0;
    put_glyph(partial);
}

void TerminalEmulator::put_glyph(const std::string& glyph) {
    Row& row = grid_[cursor_.row];
    if (row.size() <= cursor_.col) row.resize(cursor_.col + 1);

    Cell& cell = row[cursor_.col];
    cell.glyph = glyph;
    cell.style.swap(pending_style_);
    pending_style_.clear();
    cursor_.col++;
}

// ── Line control ───────────────────────────────────────────────

void TerminalEmulator::carriage_return() {
    cursor_.col = 0;
}

void TerminalEmulator::line_feed() {
    cursor_.col = 0;
    if (cursor_.row + 1 < grid_.size()) {
        cursor_.row++;
        return;
    }
    grid_.emplace_back();
    cursor_.row++;
    evict_overflow();
}

// ── CSI dispatch ───────────────────────────────────────────────

void TerminalEmulator::parse_csi_params() {
    params_.clear();
    private_seq_ = false;

    // seq_ = ESC '[' <params> <final>
    int value = -1;
    for (std::size_t i = 2; i + 1 < seq_.size(); i++) {
        char ch = seq_[i];
        if (ch >= '0' && ch <= '9') {
            if (value < 0) value = 0;
            if (value < CSI_MAX_PARAM_VALUE) value = value * 10 + (ch - '0');
            if (value > CSI_MAX_PARAM_VALUE) value = CSI_MAX_PARAM_VALUE;
        } else if (ch == ';') {
            if (params_.size() < CSI_MAX_PARAMS) params_.push_back(value);
            value = -1;
        } else {
            // '?', '>', '!', ' ' ... : private or intermediate
            private_seq_ = true;
        }
    }
    if (params_.size() < CSI_MAX_PARAMS) params_.push_back(value);
}

int TerminalEmulator::csi_param(std::size_t index, int fallback) const {
    if (index >= params_.size() || params_[index] < 0) return fallback;
    return params_[index];
}

void TerminalEmulator::dispatch_csi(char final_byte) {
    parse_csi_params();
    if (private_seq_) return;

    // Movement counts of 0 mean 1
    std::size_t count = static_cast<std::size_t>((std::max)(csi_param(0, 1), 1));

    switch (final_byte) {
        case 'A': cursor_up(count); break;
        case 'B': cursor_down(count); break;
        case 'C': cursor_right(count); break;
        case 'D': cursor_left(count); break;
        case 'K': erase_in_line(csi_param(0, 0)); break;
        case 'J': erase_in_display(csi_param(0, 0)); break;
        case 'm': pending_style_ += seq_; break;
        default: break;
    }
}

// ── Cursor movement ────────────────────────────────────────────

void TerminalEmulator::cursor_up(std::size_t n) {
    cursor_.row = cursor_.row > n ? cursor_.row - n : 0;
}

void TerminalEmulator::cursor_down(std::size_t n) {
    std::size_t target = cursor_.row + n;
    if (target < grid_.size()) {
        cursor_.row = target;
        return;
    }

    // Rows below the buffer are created on demand; eviction keeps the bound.
    // Past H new rows every older row is evicted anyway, so stop there.
    std::size_t missing = (std::min)(target + 1 - grid_.size(), scrollback_rows_);
    cursor_.row = grid_.size() - 1;
    for (std::size_t i = 0; i < missing; i++) {
        grid_.emplace_back();
        cursor_.row = grid_.size() - 1;
        evict_overflow();
    }
}

void TerminalEmulator::cursor_right(std::size_t n) {
    // Free movement over written cells; blank padding stops at MAX_CURSOR_COLUMN.
    std::size_t limit = (std::max)(grid_[cursor_.row].size(), MAX_CURSOR_COLUMN);
    cursor_.col = (std::min)(cursor_.col + n, (std::max)(limit, cursor_.col));
}

void TerminalEmulator::cursor_left(std::size_t n) {
    cursor_.col = cursor_.col > n ? cursor_.col - n : 0;
}

// ── Erasure ────────────────────────────────────────────────────

void TerminalEmulator::erase_in_line(int mode) {
    Row& row = grid_[cursor_.row];
    switch (mode) {
    case 0:
        // Cursor to end: trailing blanks are never rendered, so drop them
        if (cursor_.col < row.size()) row.resize(cursor_.col);
        break;
    case 1:
        if (cursor_.col + 1 >= row.size()) {
            row.clear();
        } else {
            for (std::size_t i = 0; i <= cursor_.col; i++) row[i] = Cell{};
        }
        break;
    case 2:
        row.clear();
        break;
    default:
        break;
    }
}

void TerminalEmulator::erase_in_display(int mode) {
    switch (mode) {
    case 0:
        erase_in_line(0);
        for (std::size_t r = cursor_.row + 1; r < grid_.size(); r++) grid_[r].clear();
        break;
    case 1:
        erase_in_line(1);
        for (std::size_t r = 0; r < cursor_.row; r++) grid_[r].clear();
        break;
    case 2:
        for (auto& row : grid_) row.clear();
        break;
    default:
        break;
    }
}

// ── Finalization ───────────────────────────────────────────────

// The row leaves the grid before the sink runs: a sink that writes back
// into this emulator must not see it again.
void TerminalEmulator::evict_overflow() {
    while (grid_.size() > scrollback_rows_) {
        Row oldest = std::move(grid_.front());
        grid_.pop_front();
        if (cursor_.row > 0) cursor_.row--;
        emit(oldest);
    }
}

void TerminalEmulator::flush() {
    std::deque<Row> rows;
    rows.swap(grid_);
    grid_.emplace_back();
    cursor_ = Cursor{};
    pending_style_.clear();
    for (const auto& row : rows) emit(row);
}

void TerminalEmulator::emit(const Row& row) {
    std::string line = render(row);
    if (line.empty()) return;
    lines_emitted_++;
    if (sink_) sink_(line);
}

std::string TerminalEmulator::render(const Row& row) {
    std::size_t end = row.size();
    while (end > 0 && row[end - 1].blank()) end--;

    std::string out;
    for (std::size_t i = 0; i < end; i++) {
        const Cell& cell = row[i];
        out += cell.style;
        if (cell.blank()) out += ' ';
        else out += cell.glyph;
    }
    return out;
}
