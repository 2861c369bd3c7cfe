#include <vcmd/virtual-screen.h>
#include <ytrace/ytrace.hpp>

extern "C" {
#include <vterm.h>
}

namespace vcmd {

class VTermVirtualScreen : public VirtualScreen {
public:
    VTermVirtualScreen(int cols, int rows) : _cols(cols), _rows(rows) {}

    ~VTermVirtualScreen() override {
        if (_vterm) {
            vterm_free(_vterm);
        }
    }

    Result<void> init() {
        _vterm = vterm_new(_rows, _cols);
        if (!_vterm) {
            return Err("vterm_new failed");
        }
        vterm_set_utf8(_vterm, 1);

        _screen = vterm_obtain_screen(_vterm);
        vterm_screen_set_callbacks(_screen, &screenCallbacks, this);
        vterm_screen_enable_altscreen(_screen, 1);
        vterm_screen_reset(_screen, 1);
        return Ok();
    }

    void write(const char* data, size_t len) override {
        if (len == 0) return;
        vterm_input_write(_vterm, data, len);
        vterm_screen_flush_damage(_screen);
    }

    Result<void> resize(int cols, int rows) override {
        if (cols <= 0 || rows <= 0) {
            return Err("invalid screen size " + std::to_string(cols) + "x" + std::to_string(rows));
        }
        if (cols == _cols && rows == _rows) return Ok();
        _cols = cols;
        _rows = rows;
        vterm_set_size(_vterm, rows, cols);
        vterm_screen_flush_damage(_screen);
        return Ok();
    }

    int cols() const override { return _cols; }
    int rows() const override { return _rows; }

    ScreenCell cell(int col, int row) const override {
        ScreenCell out;
        if (col < 0 || row < 0 || col >= _cols || row >= _rows) {
            return out;
        }

        VTermPos pos = {row, col};
        VTermScreenCell vc;
        if (!vterm_screen_get_cell(_screen, pos, &vc)) {
            return out;
        }

        // Trailing half of a wide glyph
        if (vc.chars[0] == static_cast<uint32_t>(-1)) {
            out.width = 0;
        } else {
            for (int i = 0; i < ScreenCell::MaxChars && i < VTERM_MAX_CHARS_PER_CELL; ++i) {
                out.chars[i] = vc.chars[i];
                if (vc.chars[i] == 0) break;
            }
            out.width = vc.width > 0 ? static_cast<uint8_t>(vc.width) : 1;
        }

        out.fg = convertColor(vc.fg, true);
        out.bg = convertColor(vc.bg, false);

        uint16_t attrs = 0;
        if (vc.attrs.bold)      attrs |= ATTR_BOLD;
        if (vc.attrs.italic)    attrs |= ATTR_ITALIC;
        if (vc.attrs.underline) attrs |= ATTR_UNDERLINE;
        if (vc.attrs.blink)     attrs |= ATTR_BLINK;
        if (vc.attrs.reverse)   attrs |= ATTR_REVERSE;
        if (vc.attrs.strike)    attrs |= ATTR_STRIKE;
        if (vc.attrs.conceal)   attrs |= ATTR_CONCEAL;
        out.attrs = attrs;
        return out;
    }

    CursorState cursor() const override {
        VTermPos pos;
        vterm_state_get_cursorpos(vterm_obtain_state(_vterm), &pos);
        return {pos.row, pos.col, _cursorVisible};
    }

    std::string takeOutput() override {
        std::string out;
        char buf[4096];
        while (vterm_output_get_buffer_current(_vterm) > 0) {
            size_t n = vterm_output_read(_vterm, buf, sizeof(buf));
            if (n == 0) break;
            out.append(buf, n);
        }
        return out;
    }

private:
    static Color convertColor(const VTermColor& c, bool foreground) {
        if (foreground && VTERM_COLOR_IS_DEFAULT_FG(&c)) return Color::defaultColor();
        if (!foreground && VTERM_COLOR_IS_DEFAULT_BG(&c)) return Color::defaultColor();
        if (VTERM_COLOR_IS_INDEXED(&c)) return Color::indexed(c.indexed.idx);
        if (VTERM_COLOR_IS_RGB(&c)) return Color::rgb(c.rgb.red, c.rgb.green, c.rgb.blue);
        return Color::defaultColor();
    }

    static int onSetTermProp(VTermProp prop, VTermValue* val, void* user) {
        auto* self = static_cast<VTermVirtualScreen*>(user);
        switch (prop) {
            case VTERM_PROP_CURSORVISIBLE:
                self->_cursorVisible = val->boolean;
                break;
            case VTERM_PROP_ALTSCREEN:
                ydebug("VTermVirtualScreen: altscreen={}", val->boolean);
                break;
            default:
                break;
        }
        return 1;
    }

    static inline VTermScreenCallbacks screenCallbacks = [] {
        VTermScreenCallbacks cbs = {};
        cbs.settermprop = VTermVirtualScreen::onSetTermProp;
        return cbs;
    }();

    VTerm* _vterm = nullptr;
    VTermScreen* _screen = nullptr;
    int _cols;
    int _rows;
    bool _cursorVisible = true;
};

Result<VirtualScreen::Ptr> VirtualScreen::create(int cols, int rows) noexcept {
    if (cols <= 0 || rows <= 0) {
        return Err<Ptr>("invalid screen size " + std::to_string(cols) + "x" + std::to_string(rows));
    }
    auto screen = std::make_shared<VTermVirtualScreen>(cols, rows);
    if (auto res = screen->init(); !res) {
        return Err<Ptr>("Failed to initialize virtual screen", res);
    }
    return Ok<Ptr>(screen);
}

} // namespace vcmd
