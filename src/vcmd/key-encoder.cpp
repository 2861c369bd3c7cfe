#include <vcmd/key-encoder.h>
#include <vcmd/ansi-encoder.h>

namespace vcmd {

using base::Key;

namespace {

constexpr char ESC = '\x1b';

bool hasMod(int mods, int mod) { return (mods & mod) != 0; }

// xterm modifier parameter: 1 + shift + 2*alt + 4*ctrl
int modParam(int mods) {
    int p = 1;
    if (hasMod(mods, base::ModShift)) p += 1;
    if (hasMod(mods, base::ModAlt))   p += 2;
    if (hasMod(mods, base::ModCtrl))  p += 4;
    return p;
}

// Shift and Ctrl go into the CSI parameter; Alt alone becomes an ESC prefix
bool wantsModParam(int mods) {
    return hasMod(mods, base::ModShift) || hasMod(mods, base::ModCtrl);
}

std::string withAlt(int mods, std::string seq) {
    if (hasMod(mods, base::ModAlt)) {
        return std::string(1, ESC) + seq;
    }
    return seq;
}

// CSI <final> or CSI 1;<mod> <final>
std::string cursorKey(char final, int mods) {
    if (wantsModParam(mods)) {
        return "\x1b[1;" + std::to_string(modParam(mods)) + final;
    }
    return withAlt(mods, std::string("\x1b[") + final);
}

// CSI <n>~ or CSI <n>;<mod>~
std::string tildeKey(int n, int mods) {
    if (wantsModParam(mods)) {
        return "\x1b[" + std::to_string(n) + ";" + std::to_string(modParam(mods)) + "~";
    }
    return withAlt(mods, "\x1b[" + std::to_string(n) + "~");
}

// SS3 P..S or CSI 1;<mod> P..S
std::string ss3Key(char final, int mods) {
    if (wantsModParam(mods)) {
        return "\x1b[1;" + std::to_string(modParam(mods)) + final;
    }
    return withAlt(mods, std::string("\x1bO") + final);
}

std::string controlChar(uint32_t cp) {
    if (cp >= 'a' && cp <= 'z') return std::string(1, static_cast<char>(cp - 'a' + 1));
    if (cp >= 'A' && cp <= 'Z') return std::string(1, static_cast<char>(cp - 'A' + 1));
    switch (cp) {
        case ' ':
        case '@':
        case '2':  return std::string(1, '\0');
        case '[':
        case '3':  return std::string(1, ESC);
        case '\\':
        case '4':  return std::string(1, '\x1c');
        case ']':
        case '5':  return std::string(1, '\x1d');
        case '^':
        case '6':  return std::string(1, '\x1e');
        case '_':
        case '7':  return std::string(1, '\x1f');
        case '?':
        case '8':  return std::string(1, '\x7f');
        default:   return {};
    }
}

} // namespace

std::string encodeKey(Key key, int mods, uint32_t codepoint) {
    switch (key) {
        case Key::Enter:     return withAlt(mods, "\r");
        case Key::Tab:
            if (hasMod(mods, base::ModShift)) return "\x1b[Z";
            return withAlt(mods, "\t");
        case Key::Backspace:
            if (hasMod(mods, base::ModCtrl)) return withAlt(mods, "\x08");
            return withAlt(mods, "\x7f");
        case Key::Escape:    return std::string(1, ESC);
        case Key::Space:
            if (hasMod(mods, base::ModCtrl)) return withAlt(mods, std::string(1, '\0'));
            return withAlt(mods, " ");
        case Key::Up:        return cursorKey('A', mods);
        case Key::Down:      return cursorKey('B', mods);
        case Key::Right:     return cursorKey('C', mods);
        case Key::Left:      return cursorKey('D', mods);
        case Key::Home:      return cursorKey('H', mods);
        case Key::End:       return cursorKey('F', mods);
        case Key::Insert:    return tildeKey(2, mods);
        case Key::Delete:    return tildeKey(3, mods);
        case Key::PageUp:    return tildeKey(5, mods);
        case Key::PageDown:  return tildeKey(6, mods);
        case Key::F1:        return ss3Key('P', mods);
        case Key::F2:        return ss3Key('Q', mods);
        case Key::F3:        return ss3Key('R', mods);
        case Key::F4:        return ss3Key('S', mods);
        case Key::F5:        return tildeKey(15, mods);
        case Key::F6:        return tildeKey(17, mods);
        case Key::F7:        return tildeKey(18, mods);
        case Key::F8:        return tildeKey(19, mods);
        case Key::F9:        return tildeKey(20, mods);
        case Key::F10:       return tildeKey(21, mods);
        case Key::F11:       return tildeKey(23, mods);
        case Key::F12:       return tildeKey(24, mods);
        case Key::Char: {
            if (codepoint == 0) return {};
            if (hasMod(mods, base::ModCtrl)) {
                std::string ctl = controlChar(codepoint);
                if (ctl.empty()) return {};
                return withAlt(mods, ctl);
            }
            std::string text;
            appendUtf8(text, codepoint);
            return withAlt(mods, text);
        }
        case Key::None:
            break;
    }
    return {};
}

std::string encodeText(const std::string& text, int mods) {
    if (text.empty() || looksLikeMouseSequence(text) || looksLikeEscapeFragment(text)) {
        return {};
    }
    if (!hasMod(mods, base::ModAlt)) {
        return text;
    }
    std::string out;
    out.reserve(text.size() * 2);
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        // ESC before each codepoint, not before continuation bytes
        if ((c & 0xC0) != 0x80) {
            out += ESC;
        }
        out += text[i];
    }
    return out;
}

bool looksLikeMouseSequence(const std::string& text) {
    if (text.size() < 3) return false;
    char last = text.back();
    if (last != 'M' && last != 'm') return false;
    for (size_t i = 0; i + 1 < text.size(); ++i) {
        char c = text[i];
        if (c != ';' && c != '<' && (c < '0' || c > '9')) return false;
    }
    return true;
}

bool looksLikeEscapeFragment(const std::string& text) {
    if (text == "[" || text == "<" || text == "[<") return true;
    if (!text.empty() && text[0] == '[') {
        for (size_t i = 1; i < text.size(); ++i) {
            char c = text[i];
            if (c != ';' && c != '<' && (c < '0' || c > '9')) return false;
        }
        return text.size() > 1;
    }
    return false;
}

bool isCopyKey(const base::Event& event) {
    if (event.type == base::Event::Type::Text) {
        return event.text.mods == base::ModNone && event.payloadText() == "y";
    }
    if (event.type != base::Event::Type::KeyDown || event.key.key != Key::Char) {
        return false;
    }
    uint32_t cp = event.key.codepoint;
    int mods = event.key.mods;
    if (mods == base::ModCtrl) {
        return cp == 'c' || cp == 'C' || cp == 'y' || cp == 'Y';
    }
    return mods == base::ModNone && cp == 'y';
}

bool isPasteKey(const base::Event& event) {
    return event.type == base::Event::Type::KeyDown && event.key.key == Key::Char &&
           event.key.mods == base::ModCtrl && (event.key.codepoint == 'v' || event.key.codepoint == 'V');
}

} // namespace vcmd
