//=============================================================================
// Virtual Screen Tests
//
// Covers: libvterm backed cell grid, colors, attributes, wide glyphs,
// cursor, resize and terminal replies
//=============================================================================

#include <boost/ut.hpp>
#include <vcmd/virtual-screen.h>

using namespace boost::ut;
using namespace vcmd;

suite vterm_screen_tests = [] {
    "create rejects an empty size"_test = [] {
        expect(!VirtualScreen::create(0, 10));
        expect(!VirtualScreen::create(10, 0));
    };

    "text lands in cells"_test = [] {
        auto res = VirtualScreen::create(20, 5);
        expect(fatal(res.has_value()));
        auto screen = *res;
        screen->write("hi");
        expect(screen->cell(0, 0).chars[0] == uint32_t('h'));
        expect(screen->cell(1, 0).chars[0] == uint32_t('i'));
        expect(screen->cell(2, 0).chars[0] == 0_u);
        expect(screen->cursor().col == 2_i);
        expect(screen->cursor().row == 0_i);
    };

    "colors and attributes"_test = [] {
        auto screen = *VirtualScreen::create(20, 5);
        screen->write("\x1b[1;4;38;5;196;48;2;10;20;30mX\x1b[0mY");
        ScreenCell x = screen->cell(0, 0);
        expect((x.attrs & ATTR_BOLD) != 0);
        expect((x.attrs & ATTR_UNDERLINE) != 0);
        expect(x.fg == Color::indexed(196));
        expect(x.bg == Color::rgb(10, 20, 30));

        ScreenCell y = screen->cell(1, 0);
        expect(y.attrs == 0_u);
        expect(y.fg.isDefault());
        expect(y.bg.isDefault());
    };

    "basic palette colors stay indexed"_test = [] {
        auto screen = *VirtualScreen::create(20, 5);
        screen->write("\x1b[31mR");
        expect(screen->cell(0, 0).fg == Color::indexed(1));
    };

    "wide glyph occupies two columns"_test = [] {
        auto screen = *VirtualScreen::create(20, 5);
        screen->write("\xe4\xb8\xad" "a");  // U+4E2D
        expect(screen->cell(0, 0).width == 2_u);
        expect(screen->cell(1, 0).width == 0_u);
        expect(screen->cell(2, 0).chars[0] == uint32_t('a'));
    };

    "hidden cursor is reported"_test = [] {
        auto screen = *VirtualScreen::create(20, 5);
        expect(screen->cursor().visible);
        screen->write("\x1b[?25l");
        expect(!screen->cursor().visible);
    };

    "resize changes the grid"_test = [] {
        auto screen = *VirtualScreen::create(20, 5);
        expect(screen->resize(30, 8).has_value());
        expect(screen->cols() == 30_i);
        expect(screen->rows() == 8_i);
        expect(!screen->resize(0, 8));
    };

    "out of range cell is empty"_test = [] {
        auto screen = *VirtualScreen::create(5, 2);
        expect(screen->cell(9, 9).chars[0] == 0_u);
    };

    "device status report produces a reply"_test = [] {
        auto screen = *VirtualScreen::create(20, 5);
        screen->write("ab\x1b[6n");
        std::string reply = screen->takeOutput();
        expect(reply == "\x1b[1;3R");
        expect(screen->takeOutput().empty());
    };
};
