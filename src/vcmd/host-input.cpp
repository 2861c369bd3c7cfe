#include <vcmd/host-input.h>
#include <ytrace/ytrace.hpp>
#include <cstdlib>

namespace vcmd {

using base::Event;
using base::Key;

namespace {

constexpr char ESC = '\x1b';
const std::string PASTE_START = "\x1b[200~";
const std::string PASTE_END = "\x1b[201~";

// xterm modifier parameter (1 + bits) to Mod flags
int modsFromParam(int param) {
    int bits = param > 0 ? param - 1 : 0;
    int mods = base::ModNone;
    if (bits & 1) mods |= base::ModShift;
    if (bits & 2) mods |= base::ModAlt;
    if (bits & 4) mods |= base::ModCtrl;
    return mods;
}

std::vector<int> parseParams(const std::string& s) {
    std::vector<int> params;
    size_t start = 0;
    while (start <= s.size()) {
        size_t end = s.find(';', start);
        if (end == std::string::npos) end = s.size();
        params.push_back(std::atoi(s.substr(start, end - start).c_str()));
        start = end + 1;
    }
    return params;
}

Key tildeKey(int code) {
    switch (code) {
        case 1: case 7: return Key::Home;
        case 2:  return Key::Insert;
        case 3:  return Key::Delete;
        case 4: case 8: return Key::End;
        case 5:  return Key::PageUp;
        case 6:  return Key::PageDown;
        case 11: return Key::F1;
        case 12: return Key::F2;
        case 13: return Key::F3;
        case 14: return Key::F4;
        case 15: return Key::F5;
        case 17: return Key::F6;
        case 18: return Key::F7;
        case 19: return Key::F8;
        case 20: return Key::F9;
        case 21: return Key::F10;
        case 23: return Key::F11;
        case 24: return Key::F12;
        default: return Key::None;
    }
}

Key finalKey(char final) {
    switch (final) {
        case 'A': return Key::Up;
        case 'B': return Key::Down;
        case 'C': return Key::Right;
        case 'D': return Key::Left;
        case 'H': return Key::Home;
        case 'F': return Key::End;
        case 'P': return Key::F1;
        case 'Q': return Key::F2;
        case 'R': return Key::F3;
        case 'S': return Key::F4;
        default:  return Key::None;
    }
}

// Byte length of the UTF-8 sequence starting with c
size_t utf8Length(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;
}

uint32_t decodeCodepoint(const std::string& s, size_t pos, size_t len) {
    unsigned char c = static_cast<unsigned char>(s[pos]);
    if (len == 1) return c;
    uint32_t cp = c & (0xFF >> (len + 1));
    for (size_t k = 1; k < len; ++k) {
        cp = (cp << 6) | (static_cast<unsigned char>(s[pos + k]) & 0x3F);
    }
    return cp;
}

// Control byte (not ESC) to a key event
Event controlEvent(unsigned char c, int extraMods) {
    switch (c) {
        case '\r': return Event::keyDown(Key::Enter, extraMods);
        case '\t': return Event::keyDown(Key::Tab, extraMods);
        case 0x7f: return Event::keyDown(Key::Backspace, extraMods);
        case 0x08: return Event::keyDown(Key::Backspace, extraMods | base::ModCtrl);
        case 0x00: return Event::keyDown(Key::Space, extraMods | base::ModCtrl);
        default: break;
    }
    if (c >= 0x01 && c <= 0x1a) {
        return Event::charKey('a' + c - 1, extraMods | base::ModCtrl);
    }
    static const char tail[] = {'\\', ']', '^', '_'};
    if (c >= 0x1c && c <= 0x1f) {
        return Event::charKey(static_cast<uint32_t>(tail[c - 0x1c]), extraMods | base::ModCtrl);
    }
    return Event::keyDown(Key::None, extraMods);
}

} // namespace

std::vector<Event> InputDecoder::feed(const char* data, size_t len) {
    _pending.append(data, len);
    std::vector<Event> out;

    size_t pos = 0;
    while (pos < _pending.size()) {
        if (_inPaste) {
            size_t end = _pending.find(PASTE_END, pos);
            if (end == std::string::npos) {
                // Keep a possible partial end marker in _pending
                size_t keep = std::min(_pending.size() - pos, PASTE_END.size() - 1);
                _paste.append(_pending, pos, _pending.size() - pos - keep);
                pos = _pending.size() - keep;
                break;
            }
            _paste.append(_pending, pos, end - pos);
            out.push_back(Event::pasteEvent(std::move(_paste)));
            _paste.clear();
            _inPaste = false;
            pos = end + PASTE_END.size();
            continue;
        }
        size_t n = decodeOne(_pending, pos, out);
        if (n == 0) break;
        pos += n;
    }
    _pending.erase(0, pos);
    return out;
}

std::vector<Event> InputDecoder::flush() {
    std::vector<Event> out;
    if (_inPaste) {
        // Unterminated paste: deliver what arrived
        _paste += _pending;
        out.push_back(Event::pasteEvent(std::move(_paste)));
        _paste.clear();
        _pending.clear();
        _inPaste = false;
        return out;
    }
    if (_pending.empty()) return out;

    std::string rest = std::move(_pending);
    _pending.clear();
    if (rest[0] == ESC) {
        out.push_back(Event::keyDown(Key::Escape));
        rest.erase(0, 1);
    }
    if (!rest.empty()) {
        out.push_back(Event::textInput(rest));
    }
    return out;
}

size_t InputDecoder::decodeOne(const std::string& buf, size_t pos, std::vector<Event>& out) {
    unsigned char c = static_cast<unsigned char>(buf[pos]);
    if (c == static_cast<unsigned char>(ESC)) {
        return decodeEscape(buf, pos, out);
    }
    if (c < 0x20 || c == 0x7f) {
        out.push_back(controlEvent(c, base::ModNone));
        return 1;
    }
    return decodeText(buf, pos, out);
}

size_t InputDecoder::decodeText(const std::string& buf, size_t pos, std::vector<Event>& out) {
    size_t end = pos;
    size_t codepoints = 0;
    while (end < buf.size()) {
        unsigned char c = static_cast<unsigned char>(buf[end]);
        if (c < 0x20 || c == 0x7f) break;
        size_t len = utf8Length(c);
        if (end + len > buf.size()) {
            // Partial UTF-8 at the end of the read
            if (end == pos) return 0;
            break;
        }
        end += len;
        codepoints++;
    }

    if (codepoints == 1) {
        out.push_back(Event::charKey(decodeCodepoint(buf, pos, end - pos), base::ModNone));
    } else {
        out.push_back(Event::textInput(buf.substr(pos, end - pos)));
    }
    return end - pos;
}

size_t InputDecoder::decodeEscape(const std::string& buf, size_t pos, std::vector<Event>& out) {
    if (pos + 1 >= buf.size()) {
        // Lone ESC at the end of a read is the Escape key
        out.push_back(Event::keyDown(Key::Escape));
        return 1;
    }

    char next = buf[pos + 1];
    if (next == '[') {
        return decodeCsi(buf, pos, out);
    }
    if (next == 'O') {
        if (pos + 2 >= buf.size()) return 0;
        Key key = finalKey(buf[pos + 2]);
        if (key == Key::None) {
            out.push_back(Event::charKey('O', base::ModAlt));
            return 2;
        }
        out.push_back(Event::keyDown(key));
        return 3;
    }
    if (next == ESC) {
        out.push_back(Event::keyDown(Key::Escape));
        return 1;
    }

    // Alt + key
    unsigned char c = static_cast<unsigned char>(next);
    if (c < 0x20 || c == 0x7f) {
        out.push_back(controlEvent(c, base::ModAlt));
        return 2;
    }
    size_t len = utf8Length(c);
    if (pos + 1 + len > buf.size()) return 0;
    out.push_back(Event::charKey(decodeCodepoint(buf, pos + 1, len), base::ModAlt));
    return 1 + len;
}

size_t InputDecoder::decodeCsi(const std::string& buf, size_t pos, std::vector<Event>& out) {
    // ESC [ params final
    size_t i = pos + 2;
    while (i < buf.size()) {
        unsigned char c = static_cast<unsigned char>(buf[i]);
        if (c >= 0x40 && c <= 0x7e) break;
        ++i;
    }
    if (i >= buf.size()) return 0;

    const char final = buf[i];
    const size_t consumed = i + 1 - pos;
    std::string params = buf.substr(pos + 2, i - pos - 2);

    if (params == "200" && final == '~') {
        _inPaste = true;
        _paste.clear();
        return consumed;
    }

    // SGR mouse: ESC [ < b ; x ; y M|m
    if (!params.empty() && params[0] == '<' && (final == 'M' || final == 'm')) {
        auto p = parseParams(params.substr(1));
        if (p.size() < 3) return consumed;
        int b = p[0];
        int x = p[1] - 1;
        int y = p[2] - 1;
        int mods = base::ModNone;
        if (b & 4)  mods |= base::ModShift;
        if (b & 8)  mods |= base::ModAlt;
        if (b & 16) mods |= base::ModCtrl;

        if (b & 64) {
            out.push_back(Event::scrollEvent(x, y, (b & 1) ? -1 : 1, mods));
            return consumed;
        }
        base::MouseButton button = base::MouseButton::None;
        switch (b & 3) {
            case 0: button = base::MouseButton::Left; break;
            case 1: button = base::MouseButton::Middle; break;
            case 2: button = base::MouseButton::Right; break;
            default: break;
        }
        if (final == 'm') {
            out.push_back(Event::mouseUp(x, y, button, mods));
        } else if (b & 32) {
            if (button != base::MouseButton::None) {
                out.push_back(Event::mouseDrag(x, y, button, mods));
            }
        } else {
            out.push_back(Event::mouseDown(x, y, button, mods));
        }
        return consumed;
    }

    auto p = parseParams(params);
    int mods = p.size() >= 2 ? modsFromParam(p[1]) : base::ModNone;

    if (final == 'Z') {
        out.push_back(Event::keyDown(Key::Tab, base::ModShift));
        return consumed;
    }
    if (final == '~') {
        Key key = tildeKey(p.empty() ? 0 : p[0]);
        if (key != Key::None) {
            out.push_back(Event::keyDown(key, mods));
        } else {
            ydebug("InputDecoder: unhandled CSI {}~", params);
        }
        return consumed;
    }
    Key key = finalKey(final);
    if (key != Key::None) {
        out.push_back(Event::keyDown(key, mods));
    } else {
        ydebug("InputDecoder: unhandled CSI {}{}", params, final);
    }
    return consumed;
}

} // namespace vcmd
