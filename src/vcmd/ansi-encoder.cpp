#include <vcmd/ansi-encoder.h>
#include <algorithm>
#include <wchar.h>

namespace vcmd {

namespace {

constexpr const char* RESET = "\x1b[0m";

struct RunKey {
    CellStyle style;
    bool cursor = false;
    bool selected = false;

    bool operator==(const RunKey& o) const {
        return style == o.style && cursor == o.cursor && selected == o.selected;
    }
    bool operator!=(const RunKey& o) const { return !(*this == o); }
};

void appendGlyph(std::string& out, const ScreenCell& cell) {
    if (cell.chars[0] == 0) {
        out += ' ';
        return;
    }
    for (int i = 0; i < ScreenCell::MaxChars && cell.chars[i] != 0; ++i) {
        appendUtf8(out, cell.chars[i]);
    }
}

// Length of the escape sequence at text[pos] (text[pos] == ESC)
size_t escapeLength(const std::string& text, size_t pos) {
    size_t i = pos + 1;
    if (i >= text.size()) return 1;
    char kind = text[i++];
    if (kind == '[') {
        while (i < text.size()) {
            unsigned char c = static_cast<unsigned char>(text[i++]);
            if (c >= 0x40 && c <= 0x7E) break;
        }
        return i - pos;
    }
    if (kind == ']') {
        while (i < text.size()) {
            if (text[i] == '\a') return i + 1 - pos;
            if (text[i] == '\x1b' && i + 1 < text.size() && text[i + 1] == '\\') return i + 2 - pos;
            ++i;
        }
        return i - pos;
    }
    return 2;
}

// Decode one UTF-8 sequence; returns its byte length (1 on malformed input)
size_t decodeUtf8(const std::string& text, size_t pos, uint32_t& cp) {
    unsigned char c = static_cast<unsigned char>(text[pos]);
    size_t len = 1;
    if (c < 0x80) { cp = c; return 1; }
    if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; len = 2; }
    else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; len = 3; }
    else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; len = 4; }
    else { cp = 0xFFFD; return 1; }
    if (pos + len > text.size()) { cp = 0xFFFD; return 1; }
    for (size_t k = 1; k < len; ++k) {
        unsigned char cc = static_cast<unsigned char>(text[pos + k]);
        if ((cc & 0xC0) != 0x80) { cp = 0xFFFD; return 1; }
        cp = (cp << 6) | (cc & 0x3F);
    }
    return len;
}

int codepointWidth(uint32_t cp) {
    if (cp < 0x80) return cp >= 0x20 ? 1 : 0;
    int w = ::wcwidth(static_cast<wchar_t>(cp));
    return w < 0 ? 1 : w;
}

} // namespace

//=============================================================================
// Rows
//=============================================================================

std::string AnsiEncoder::encodeRow(const VirtualScreen& screen, int row, const RowOverlay& overlay) const {
    std::string out;
    std::string run;
    RunKey current;
    bool haveRun = false;

    auto flush = [&]() {
        if (!haveRun) return;
        out += sgr(resolveStyle(current.style, current.cursor, current.selected, _palette));
        out += run;
        out += RESET;
        run.clear();
    };

    const int cols = screen.cols();
    for (int col = 0; col < cols; ++col) {
        ScreenCell cell = screen.cell(col, row);
        if (cell.width == 0) continue;

        RunKey key;
        key.style = CellStyle::of(cell);
        key.cursor = overlay.cursorCol == col;
        key.selected = overlay.selection && overlay.selection->isSelected(overlay.selectionLine, col);

        if (haveRun && key != current) {
            flush();
        }
        current = key;
        haveRun = true;
        appendGlyph(run, cell);
    }
    flush();
    return out;
}

std::string AnsiEncoder::plainRow(const VirtualScreen& screen, int row, std::vector<int>* columns) const {
    std::string out;
    const int cols = screen.cols();
    int codepoints = 0;
    if (columns) {
        columns->assign(cols + 1, 0);
    }
    for (int col = 0; col < cols; ++col) {
        ScreenCell cell = screen.cell(col, row);
        if (columns) {
            // A continuation cell points past its wide glyph
            (*columns)[col] = codepoints;
        }
        if (cell.width == 0) continue;
        appendGlyph(out, cell);
        int n = 0;
        while (n < ScreenCell::MaxChars && cell.chars[n] != 0) ++n;
        codepoints += std::max(n, 1);
    }
    if (columns) {
        (*columns)[cols] = codepoints;
    }
    while (!out.empty() && (out.back() == ' ' || out.back() == '\t')) {
        out.pop_back();
    }
    return out;
}

ScreenSnapshot AnsiEncoder::snapshot(const VirtualScreen& screen) const {
    ScreenSnapshot snap;
    const int rows = screen.rows();
    snap.plain.reserve(rows);
    snap.styled.reserve(rows);
    for (int row = 0; row < rows; ++row) {
        snap.plain.push_back(plainRow(screen, row));
        snap.styled.push_back(encodeRow(screen, row));
    }
    return snap;
}

//=============================================================================
// Frames
//=============================================================================

std::string AnsiEncoder::encodeLive(const VirtualScreen& screen, const FrameOverlay& overlay) const {
    const CursorState cursor = screen.cursor();
    const bool cursorShown = overlay.showCursor && cursor.visible;

    std::string out;
    const int rows = screen.rows();
    for (int row = 0; row < rows; ++row) {
        RowOverlay ro;
        ro.cursorCol = (cursorShown && cursor.row == row) ? cursor.col : -1;
        ro.selection = overlay.selection;
        ro.selectionLine = row;
        if (row > 0) out += '\n';
        out += encodeRow(screen, row, ro);
    }
    return out;
}

std::string AnsiEncoder::encodeScrolled(const ScrollbackStore& scrollback, size_t offset,
                                        const VirtualScreen& screen, const FrameOverlay& overlay) const {
    const size_t total = scrollback.size();
    offset = std::min(offset, total);
    const size_t rows = static_cast<size_t>(std::max(screen.rows(), 0));
    const size_t start = total - offset;

    std::vector<std::string> lines;
    lines.reserve(rows);
    for (size_t i = start; i < total && lines.size() < rows; ++i) {
        lines.push_back(scrollback.line(i));
    }
    // Live rows sit after the whole store in selection space
    for (int row = 0; lines.size() < rows && row < screen.rows(); ++row) {
        RowOverlay ro;
        ro.selection = overlay.selection;
        ro.selectionLine = static_cast<int>(total) + row;
        lines.push_back(encodeRow(screen, row, ro));
    }
    while (lines.size() < rows) {
        lines.emplace_back();
    }

    if (!lines.empty() && offset > 0) {
        lines[0] = scrollIndicator(offset, screen.cols());
    }

    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

std::string AnsiEncoder::scrollIndicator(size_t offset, int cols) const {
    std::string text = " ↑ SCROLL: " + std::to_string(offset) + " lines (End to return) ";
    int width = displayWidth(text);
    if (width > cols) {
        return fitToWidth(sgr(_palette.indicator) + text, cols);
    }
    return std::string(cols - width, ' ') + sgr(_palette.indicator) + text + RESET;
}

//=============================================================================
// Text helpers
//=============================================================================

void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x110000) {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        appendUtf8(out, 0xFFFD);
    }
}

std::string stripAnsi(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        if (text[i] == '\x1b') {
            i += escapeLength(text, i);
            continue;
        }
        out += text[i++];
    }
    return out;
}

int displayWidth(const std::string& text) {
    int width = 0;
    for (size_t i = 0; i < text.size();) {
        if (text[i] == '\x1b') {
            i += escapeLength(text, i);
            continue;
        }
        uint32_t cp;
        i += decodeUtf8(text, i, cp);
        width += codepointWidth(cp);
    }
    return width;
}

std::string fitToWidth(const std::string& text, int cols) {
    std::string out;
    out.reserve(text.size() + 8);
    int width = 0;
    bool styled = false;
    bool clipped = false;
    for (size_t i = 0; i < text.size();) {
        if (text[i] == '\x1b') {
            size_t n = escapeLength(text, i);
            out.append(text, i, n);
            styled = true;
            i += n;
            continue;
        }
        uint32_t cp;
        size_t n = decodeUtf8(text, i, cp);
        int w = codepointWidth(cp);
        if (width + w > cols) {
            clipped = true;
            break;
        }
        out.append(text, i, n);
        width += w;
        i += n;
    }
    if (clipped && styled) {
        out += RESET;
    }
    if (width < cols) {
        out.append(static_cast<size_t>(cols - width), ' ');
    }
    return out;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

} // namespace vcmd
