#include <vcmd/style-palette.h>
#include <vcmd/config.h>

namespace vcmd {

StylePalette StylePalette::fromConfig(const Config& config) {
    StylePalette p;
    p.cursor = config.get<std::string>("palette/cursor", p.cursor);
    p.selection = config.get<std::string>("palette/selection", p.selection);
    p.indicator = config.get<std::string>("palette/indicator", p.indicator);
    p.error = config.get<std::string>("palette/error", p.error);
    return p;
}

StyleTier resolveTier(bool isCursor, bool isSelected) {
    if (isCursor) return StyleTier::Cursor;
    if (isSelected) return StyleTier::Selection;
    return StyleTier::Base;
}

namespace {

void addParam(std::string& out, const std::string& param) {
    if (!out.empty()) out += ';';
    out += param;
}

void addColor(std::string& out, const Color& c, bool foreground) {
    const char* base = foreground ? "38" : "48";
    switch (c.kind) {
        case Color::Kind::Default:
            break;
        case Color::Kind::Indexed:
            addParam(out, std::string(base) + ";5;" + std::to_string(c.index));
            break;
        case Color::Kind::Rgb:
            addParam(out, std::string(base) + ";2;" + std::to_string(c.r) + ";" +
                          std::to_string(c.g) + ";" + std::to_string(c.b));
            break;
    }
}

} // namespace

std::string baseStyleParams(const CellStyle& style) {
    std::string out;
    if (style.attrs & ATTR_REVERSE)   addParam(out, "7");
    if (style.attrs & ATTR_UNDERLINE) addParam(out, "4");
    if (style.attrs & ATTR_BOLD)      addParam(out, "1");
    if (style.attrs & ATTR_ITALIC)    addParam(out, "3");
    if (style.attrs & ATTR_BLINK)     addParam(out, "5");
    if (style.attrs & ATTR_CONCEAL)   addParam(out, "8");
    if (style.attrs & ATTR_STRIKE)    addParam(out, "9");
    addColor(out, style.fg, true);
    addColor(out, style.bg, false);
    return out;
}

std::string resolveStyle(const CellStyle& style, bool isCursor, bool isSelected,
                         const StylePalette& palette) {
    switch (resolveTier(isCursor, isSelected)) {
        case StyleTier::Cursor:
            return palette.cursor;
        case StyleTier::Selection:
            return palette.selection;
        case StyleTier::Base:
            break;
    }
    return baseStyleParams(style);
}

std::string sgr(const std::string& params) {
    if (params.empty()) return {};
    return "\x1b[" + params + "m";
}

} // namespace vcmd
