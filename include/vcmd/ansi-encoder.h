#pragma once

#include <vcmd/scrollback.h>
#include <vcmd/selection.h>
#include <vcmd/style-palette.h>
#include <vcmd/virtual-screen.h>
#include <cstdint>
#include <string>
#include <vector>

namespace vcmd {

// Overlays for one screen row
struct RowOverlay {
    int cursorCol = -1;                         // -1: cursor not on this row
    const SelectionModel* selection = nullptr;
    int selectionLine = 0;                      // this row's line in selection space
};

// Overlays for a whole frame
struct FrameOverlay {
    bool showCursor = false;                    // focused and the process wants it
    const SelectionModel* selection = nullptr;
};

//=============================================================================
// AnsiEncoder - virtual screen to styled text
//
// Output is a pure function of (grid, overlays, palette). Cells are batched
// into runs of identical (fg, bg, attrs, cursor, selected); each run is
// emitted as style + text + reset.
//=============================================================================

class AnsiEncoder {
public:
    explicit AnsiEncoder(StylePalette palette = {}) : _palette(std::move(palette)) {}

    const StylePalette& palette() const { return _palette; }

    std::string encodeRow(const VirtualScreen& screen, int row, const RowOverlay& overlay = {}) const;

    // Glyphs only, trailing whitespace removed. When columns is given it
    // receives, per screen column, the codepoint index that column starts at
    // (cols + 1 entries)
    std::string plainRow(const VirtualScreen& screen, int row, std::vector<int>* columns = nullptr) const;

    // Plain and styled (no overlays) form of every row
    ScreenSnapshot snapshot(const VirtualScreen& screen) const;

    // Live grid, rows joined by '\n'
    std::string encodeLive(const VirtualScreen& screen, const FrameOverlay& overlay) const;

    // Scrollback tail from (size - offset), then live rows, padded to the
    // screen height. Scrollback rows carry no overlays. The top row is
    // replaced by the scroll indicator.
    std::string encodeScrolled(const ScrollbackStore& scrollback, size_t offset,
                               const VirtualScreen& screen, const FrameOverlay& overlay) const;

    // Right-aligned " ↑ SCROLL: N lines (End to return) " padded to cols
    std::string scrollIndicator(size_t offset, int cols) const;

private:
    StylePalette _palette;
};

//=============================================================================
// Text helpers
//=============================================================================

void appendUtf8(std::string& out, uint32_t cp);

// Remove CSI / OSC escape sequences
std::string stripAnsi(const std::string& text);

// Terminal columns taken by text, escapes excluded
int displayWidth(const std::string& text);

// Clip to cols visible columns (escapes kept), then pad with spaces
std::string fitToWidth(const std::string& text, int cols);

std::vector<std::string> splitLines(const std::string& text);

} // namespace vcmd
