#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <string>
#include <vector>
#include <core/constants.hpp>

// TerminalEmulator: a line-oriented virtual screen.
//
// Bytes written to a console are replayed against a grid of rows so that
// carriage returns, cursor movement and erasures resolve to what the terminal
// would finally show. A row is handed to the sink ("finalized") only once it
// can no longer be rewritten: when it scrolls out of the scrollback window,
// or on flush(). Progress bars that redraw one row thousands of times
// therefore produce a single line.
//
// Recognised input:
//   printable bytes / UTF-8 codepoints, \t   -> stored in a cell
//   \r, \n                                   -> cursor motion
//   CSI n A/B/C/D                            -> cursor up/down/right/left
//   CSI n K, CSI n J                         -> erase in line / display
//   CSI ... m                                -> kept verbatim, attached to the next glyph
//   any other CSI, ESC x, OSC strings        -> consumed, no effect
//   other control bytes                      -> dropped
//
// Not thread-safe; callers serialise access.

struct Cell {
    std::string glyph;   // one codepoint, empty when blank
    std::string style;   // SGR sequences that arrived just before the glyph

    bool blank() const { return glyph.empty(); }
};

using Row = std::vector<Cell>;

struct Cursor {
    std::size_t row = 0;
    std::size_t col = 0;
};

class TerminalEmulator {
public:
    using LineSink = std::function<void(const std::string&)>;

    explicit TerminalEmulator(LineSink sink,
                              std::size_t scrollback_rows = DEFAULT_SCROLLBACK_ROWS);

    void write(const char* data, std::size_t len);
    void write(const std::string& data) { write(data.data(), data.size()); }

    // Finalize every buffered row top-to-bottom, then start over with an
    // empty screen. Style bytes not yet attached to a glyph are discarded.
    void flush();

    // Number of rows still buffered (revisable).
    std::size_t row_count() const { return grid_.size(); }
    Cursor cursor() const { return cursor_; }
    std::size_t scrollback_rows() const { return scrollback_rows_; }
    // Non-empty lines handed to the sink so far.
    std::size_t lines_emitted() const { return lines_emitted_; }

    // Bytes for a row: each cell's style then its glyph, blanks as spaces,
    // trailing blanks trimmed.
    static std::string render(const Row& row);

private:
    enum class ParseState {
        Ground,
        Escape,     // after ESC
        Csi,        // after ESC [
        Osc,        // after ESC ], until BEL or ESC backslash
        OscEscape,  // ESC seen inside an OSC string
    };

    void feed(unsigned char c);
    void feed_ground(unsigned char c);
    void put_glyph(const std::string& glyph);
    void flush_partial_codepoint();

    void carriage_return();
    void line_feed();

    void dispatch_csi(char final_byte);
    int csi_param(std::size_t index, int fallback) const;
    void parse_csi_params();

    void cursor_up(std::size_t n);
    void cursor_down(std::size_t n);
    void cursor_right(std::size_t n);
    void cursor_left(std::size_t n);
    void erase_in_line(int mode);
    void erase_in_display(int mode);

    void evict_overflow();
    void emit(const Row& row);

    LineSink sink_;
    std::size_t scrollback_rows_;
    std::deque<Row> grid_;
    Cursor cursor_;
    std::string pending_style_;
    std::size_t lines_emitted_ = 0;

    ParseState state_ = ParseState::Ground;
    std::string seq_;               // raw bytes of the escape sequence in progress
    std::vector<int> params_;       // -1 marks an omitted parameter
    bool private_seq_ = false;      // CSI carried a private marker or intermediate byte
    std::string codepoint_;         // partial UTF-8 sequence
    std::size_t codepoint_need_ = 0;
};
