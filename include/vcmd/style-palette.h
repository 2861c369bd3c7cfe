#pragma once

#include <vcmd/virtual-screen.h>
#include <string>

namespace vcmd {

class Config;

//=============================================================================
// StylePalette - overlay and chrome styles, passed into every encoder call
//
// Styles are SGR parameter strings ("7", "1;38;5;51") without ESC[ and m.
//=============================================================================

struct StylePalette {
    std::string cursor = "7";
    std::string selection = "7";
    std::string indicator = "1;38;5;51";
    std::string error = "31";

    static StylePalette fromConfig(const Config& config);
};

struct CellStyle {
    Color fg;
    Color bg;
    uint16_t attrs = 0;

    static CellStyle of(const ScreenCell& cell) { return {cell.fg, cell.bg, cell.attrs}; }

    bool operator==(const CellStyle& o) const { return fg == o.fg && bg == o.bg && attrs == o.attrs; }
    bool operator!=(const CellStyle& o) const { return !(*this == o); }
};

// Precedence: cursor over selection over the cell's own style
enum class StyleTier { Base, Selection, Cursor };

StyleTier resolveTier(bool isCursor, bool isSelected);

// SGR parameters for the cell's own attributes and colours; "" if all default
std::string baseStyleParams(const CellStyle& style);

// SGR parameters for a cell after applying the overlays
std::string resolveStyle(const CellStyle& style, bool isCursor, bool isSelected,
                         const StylePalette& palette);

// "\x1b[<params>m", or "" for empty params
std::string sgr(const std::string& params);

} // namespace vcmd
