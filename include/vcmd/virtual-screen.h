#pragma once

#include <vcmd/result.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace vcmd {

//=============================================================================
// Cell model
//=============================================================================

struct Color {
    enum class Kind : uint8_t { Default, Indexed, Rgb };

    Kind kind = Kind::Default;
    uint8_t index = 0;
    uint8_t r = 0, g = 0, b = 0;

    static Color defaultColor() { return {}; }
    static Color indexed(uint8_t i) { Color c; c.kind = Kind::Indexed; c.index = i; return c; }
    static Color rgb(uint8_t r, uint8_t g, uint8_t b) {
        Color c; c.kind = Kind::Rgb; c.r = r; c.g = g; c.b = b; return c;
    }

    bool isDefault() const { return kind == Kind::Default; }

    bool operator==(const Color& o) const {
        if (kind != o.kind) return false;
        switch (kind) {
            case Kind::Default: return true;
            case Kind::Indexed: return index == o.index;
            case Kind::Rgb: return r == o.r && g == o.g && b == o.b;
        }
        return false;
    }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

// Attribute bits
constexpr uint16_t ATTR_BOLD      = 1 << 0;
constexpr uint16_t ATTR_ITALIC    = 1 << 1;
constexpr uint16_t ATTR_UNDERLINE = 1 << 2;
constexpr uint16_t ATTR_BLINK     = 1 << 3;
constexpr uint16_t ATTR_REVERSE   = 1 << 4;
constexpr uint16_t ATTR_STRIKE    = 1 << 5;
constexpr uint16_t ATTR_CONCEAL   = 1 << 6;

struct ScreenCell {
    static constexpr int MaxChars = 6;

    // Zero-terminated; chars[0] == 0 is an empty cell (rendered as a space)
    uint32_t chars[MaxChars] = {};
    // Columns occupied: 2 for the leading half of a wide glyph, 0 for its trailing half
    uint8_t width = 1;
    Color fg;
    Color bg;
    uint16_t attrs = 0;
};

struct CursorState {
    int row = 0;
    int col = 0;
    bool visible = true;
};

//=============================================================================
// VirtualScreen - terminal emulator state for one pane
//=============================================================================

class VirtualScreen {
public:
    using Ptr = std::shared_ptr<VirtualScreen>;

    // libvterm backed screen
    static Result<Ptr> create(int cols, int rows) noexcept;

    virtual ~VirtualScreen() = default;

    // Feed process output through the emulator
    virtual void write(const char* data, size_t len) = 0;
    void write(const std::string& data) { write(data.data(), data.size()); }

    virtual Result<void> resize(int cols, int rows) = 0;

    virtual int cols() const = 0;
    virtual int rows() const = 0;

    // Out-of-range positions yield an empty default cell
    virtual ScreenCell cell(int col, int row) const = 0;
    virtual CursorState cursor() const = 0;

    // Replies the emulator wants sent back to the process (DA, DSR, ...)
    virtual std::string takeOutput() = 0;

protected:
    VirtualScreen() = default;
};

} // namespace vcmd
