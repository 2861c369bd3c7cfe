#pragma once

#include "types.h"
#include <cstdint>
#include <memory>
#include <string>

namespace vcmd {
namespace base {

// Keys that are not plain text. Text input travels as Event::Type::Text.
enum class Key : int {
    None = 0,
    Enter,
    Tab,
    Backspace,
    Escape,
    Space,
    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    PageUp,
    PageDown,
    Insert,
    Delete,
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
    // Printable key carrying modifiers (ctrl+c, alt+x): codepoint in KeyEvent::codepoint
    Char
};

enum Mod : int {
    ModNone  = 0,
    ModShift = 1 << 0,
    ModAlt   = 1 << 1,
    ModCtrl  = 1 << 2,
};

enum class MouseButton : int {
    None = 0,
    Left,
    Middle,
    Right
};

struct Event {
    enum class Type {
        None,
        // Input events
        KeyDown,
        Text,
        MouseDown,
        MouseUp,
        MouseDrag,
        Scroll,
        // Resize (terminal cells)
        Resize,
        // Poll
        PollReadable,
        // Timer
        Timer,
        // POSIX signal
        Signal,
        // Bracketed paste
        Paste
    };

    struct KeyEvent {
        Key key;
        int mods;
        uint32_t codepoint;
    };

    struct TextEvent {
        int mods;
    };

    struct MouseEvent {
        int x;
        int y;
        MouseButton button;
        int mods;
    };

    struct ScrollEvent {
        int x;
        int y;
        int dy;  // > 0 wheel up (towards history)
        int mods;
    };

    struct ResizeEvent {
        int cols;
        int rows;
    };

    struct PollEvent {
        int fd;
    };

    struct TimerEvent {
        int timerId;
    };

    struct SignalEvent {
        int signum;
    };

    Type type = Type::None;

    union {
        KeyEvent key;
        TextEvent text;
        MouseEvent mouse;
        ScrollEvent scroll;
        ResizeEvent resize;
        PollEvent poll;
        TimerEvent timer;
        SignalEvent signal;
    };

    // Text and Paste carry a std::string here.
    // Handlers cast via std::static_pointer_cast<std::string>(event.payload).
    std::shared_ptr<void> payload;

    Event() : key{Key::None, 0, 0} {}

    const std::string& payloadText() const {
        static const std::string empty;
        return payload ? *std::static_pointer_cast<std::string>(payload) : empty;
    }

    // Factory methods
    static Event keyDown(Key key, int mods = ModNone) {
        Event e;
        e.type = Type::KeyDown;
        e.key = {key, mods, 0};
        return e;
    }

    static Event charKey(uint32_t codepoint, int mods) {
        Event e;
        e.type = Type::KeyDown;
        e.key = {Key::Char, mods, codepoint};
        return e;
    }

    static Event textInput(std::string text, int mods = ModNone) {
        Event e;
        e.type = Type::Text;
        e.text = {mods};
        e.payload = std::make_shared<std::string>(std::move(text));
        return e;
    }

    static Event mouseDown(int x, int y, MouseButton button = MouseButton::Left, int mods = ModNone) {
        Event e;
        e.type = Type::MouseDown;
        e.mouse = {x, y, button, mods};
        return e;
    }

    static Event mouseUp(int x, int y, MouseButton button = MouseButton::Left, int mods = ModNone) {
        Event e;
        e.type = Type::MouseUp;
        e.mouse = {x, y, button, mods};
        return e;
    }

    static Event mouseDrag(int x, int y, MouseButton button = MouseButton::Left, int mods = ModNone) {
        Event e;
        e.type = Type::MouseDrag;
        e.mouse = {x, y, button, mods};
        return e;
    }

    static Event scrollEvent(int x, int y, int dy, int mods = ModNone) {
        Event e;
        e.type = Type::Scroll;
        e.scroll = {x, y, dy, mods};
        return e;
    }

    static Event resizeEvent(int cols, int rows) {
        Event e;
        e.type = Type::Resize;
        e.resize = {cols, rows};
        return e;
    }

    static Event pollReadable(int fd) {
        Event e;
        e.type = Type::PollReadable;
        e.poll = {fd};
        return e;
    }

    static Event timerEvent(int timerId) {
        Event e;
        e.type = Type::Timer;
        e.timer = {timerId};
        return e;
    }

    static Event signalEvent(int signum) {
        Event e;
        e.type = Type::Signal;
        e.signal = {signum};
        return e;
    }

    static Event pasteEvent(std::string text) {
        Event e;
        e.type = Type::Paste;
        e.payload = std::make_shared<std::string>(std::move(text));
        return e;
    }
};

} // namespace base
} // namespace vcmd
