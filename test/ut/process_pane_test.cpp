//=============================================================================
// Process Pane Tests
//
// Covers: lifecycle and restart policy, scrollback scrolling and lock,
// selection to clipboard, key forwarding, resize, inline spawn errors
//=============================================================================

#include <boost/ut.hpp>
#include "harness/pane_harness.h"

using namespace boost::ut;
using namespace vcmd;
using namespace vcmd::test;
using base::Event;
using base::Key;

namespace {

// Text cell (col, row) in pane coordinates, past the one-cell border
Event down(int col, int row) { return Event::mouseDown(col + 1, row + 1); }
Event drag(int col, int row) { return Event::mouseDrag(col + 1, row + 1); }
Event up(int col, int row) { return Event::mouseUp(col + 1, row + 1); }

void wheel(ProcessPane& pane, int dy, int times) {
    for (int i = 0; i < times; ++i) {
        (void)pane.onEvent(Event::scrollEvent(5, 5, dy));
    }
}

} // namespace

suite process_pane_lifecycle_tests = [] {
    "start spawns at the pane size"_test = [] {
        PaneHarness h(RestartPolicy::shell(), 40, 10);
        expect(fatal(h.pane().start().has_value()));
        expect(h.pane().isRunning());
        expect(h.sessions.size() == 1_u);
        expect(h.session().spawned.cols == 40_i);
        expect(h.session().spawned.rows == 10_i);
        expect(h.session().isReading()) << "a read is always in flight while running";
        expect(h.pane().statusLine() == "running: /bin/sh");
    };

    "command role reserves a status row"_test = [] {
        PaneHarness h(RestartPolicy::command(), 40, 10);
        expect(fatal(h.pane().start().has_value()));
        expect(h.session().spawned.rows == 9_i);
        expect(h.pane().rows() == 9_i);
    };

    "output reaches the screen"_test = [] {
        PaneHarness h;
        expect(fatal(h.pane().start().has_value()));
        h.session().emit("hello\r\n");
        expect(stripAnsi(h.frame()).find("hello") == 0_u);
        expect(h.session().isReading());
    };

    "output schedules a throttled render"_test = [] {
        PaneHarness h;
        expect(fatal(h.pane().start().has_value()));
        h.ticks().fire();
        h.session().emit("abc");
        expect(h.pane().renderer().isDirty());
        h.ticks().fire();
        expect(stripAnsi(h.pane().view()).find("abc") == 0_u);
    };

    "shell role restarts after exit"_test = [] {
        PaneHarness h(RestartPolicy::shell());
        int exits = 0;
        h.pane().setExitHook([&](const std::string&) { exits++; });
        expect(fatal(h.pane().start().has_value()));
        h.emitLines(15);
        size_t kept = h.pane().scrollback().size();

        h.session().exit("exit status 1");
        expect(exits == 1_i);
        expect(h.sessions.size() == 2_u);
        expect(h.pane().isRunning());
        expect(h.pane().scrollback().size() == kept) << "scrollback survives a restart";
    };

    "command role stays stopped after exit"_test = [] {
        PaneHarness h(RestartPolicy::command());
        expect(fatal(h.pane().start().has_value()));
        h.session().exit("exit status 1");
        expect(h.sessions.size() == 1_u);
        expect(!h.pane().isRunning());
        expect(h.pane().exitError() == "exit status 1");
        expect(h.pane().statusLine() == "exited: exit status 1");
    };

    "clean exit has an empty error"_test = [] {
        PaneHarness h(RestartPolicy::command());
        expect(fatal(h.pane().start().has_value()));
        h.session().exit("");
        expect(h.pane().statusLine() == "exited");
    };

    "explicit stop does not restart a shell"_test = [] {
        PaneHarness h(RestartPolicy::shell());
        expect(fatal(h.pane().start().has_value()));
        expect(h.pane().stop().has_value());
        expect(!h.pane().isRunning());
        expect(h.sessions.size() == 1_u);

        expect(h.pane().start().has_value());
        expect(h.sessions.size() == 2_u) << "a later start works again";
        expect(h.pane().isRunning());
    };

    "spawn failure is shown inline in the error style"_test = [] {
        PaneHarness h(RestartPolicy::shell(), 80, 10);
        h.failNextStart = "exec nope: No such file or directory";
        expect(h.pane().start().has_value()) << "the failure is rendered, not returned";
        expect(!h.pane().isRunning());
        expect(h.sessions.size() == 1_u);

        std::string frame = h.frame();
        expect(frame.find("\x1b[38;5;1m") != std::string::npos) << "palette red";
        expect(stripAnsi(frame).find("Error starting process: exec nope: No such file or directory") == 0_u);
        expect(h.pane().statusLine().find("exited: ") == 0_u);
    };

    "writes are dropped while stopped"_test = [] {
        PaneHarness h(RestartPolicy::command());
        expect(fatal(h.pane().start().has_value()));
        h.pane().setFocused(true);
        h.session().exit("");
        auto res = h.pane().onEvent(Event::textInput("ls"));
        expect(res.has_value());
        expect(!*res);
        expect(h.session().written.empty());
    };
};

suite process_pane_scroll_tests = [] {
    "wheel scrolling is clamped to the history"_test = [] {
        PaneHarness h(RestartPolicy::shell(), 40, 10);
        expect(fatal(h.pane().start().has_value()));
        h.emitLines(59);
        expect(fatal(h.pane().scrollback().size() == 50_u));

        wheel(h.pane(), 1, 3);
        expect(h.pane().scrollOffset() == 9_u);
        expect(h.pane().isScrollLocked());
        expect(h.frame().find("SCROLL: 9 lines") != std::string::npos);

        wheel(h.pane(), -1, 4);
        expect(h.pane().scrollOffset() == 0_u);
        expect(!h.pane().isScrollLocked());
        expect(h.frame().find("SCROLL") == std::string::npos);

        wheel(h.pane(), 1, 40);
        expect(h.pane().scrollOffset() == 50_u);
    };

    "locked view stays on the same content while output arrives"_test = [] {
        PaneHarness h(RestartPolicy::shell(), 40, 10);
        expect(fatal(h.pane().start().has_value()));
        h.emitLines(30);
        wheel(h.pane(), 1, 1);
        expect(h.pane().scrollOffset() == 3_u);

        h.session().emit("more\r\n");
        expect(h.pane().scrollOffset() == 4_u);
        expect(h.pane().isScrollLocked());
    };

    "Home and End jump through the history"_test = [] {
        PaneHarness h(RestartPolicy::shell(), 40, 10);
        expect(fatal(h.pane().start().has_value()));
        h.pane().setFocused(true);
        h.emitLines(25);

        (void)h.pane().onEvent(Event::keyDown(Key::Home));
        expect(h.pane().scrollOffset() == h.pane().scrollback().size());
        (void)h.pane().onEvent(Event::keyDown(Key::End));
        expect(h.pane().scrollOffset() == 0_u);
        expect(h.session().written.empty()) << "navigation keys are not forwarded";
    };

    "page keys scroll once the process has exited"_test = [] {
        PaneHarness h(RestartPolicy::command(), 40, 10);
        expect(fatal(h.pane().start().has_value()));
        h.pane().setFocused(true);
        h.emitLines(40);
        h.session().exit("");

        (void)h.pane().onEvent(Event::keyDown(Key::PageUp));
        expect(h.pane().scrollOffset() == size_t(h.pane().pageSize()));
        (void)h.pane().onEvent(Event::keyDown(Key::PageDown));
        expect(h.pane().scrollOffset() == 0_u);
    };

    "page keys go to a live process"_test = [] {
        PaneHarness h(RestartPolicy::shell(), 40, 10);
        expect(fatal(h.pane().start().has_value()));
        h.pane().setFocused(true);
        (void)h.pane().onEvent(Event::keyDown(Key::PageUp));
        expect(h.session().written == "\x1b[5~");
    };

    "exit releases the lock but keeps the position"_test = [] {
        PaneHarness h(RestartPolicy::command(), 40, 10);
        expect(fatal(h.pane().start().has_value()));
        h.emitLines(30);
        wheel(h.pane(), 1, 1);
        h.session().exit("exit status 2");
        expect(!h.pane().isScrollLocked());
        expect(h.pane().scrollOffset() == 3_u);
    };

    "resize returns to the live view"_test = [] {
        PaneHarness h(RestartPolicy::shell(), 40, 10);
        expect(fatal(h.pane().start().has_value()));
        h.emitLines(30);
        wheel(h.pane(), 1, 2);
        (void)h.pane().onEvent(down(0, 0));
        (void)h.pane().onEvent(up(3, 0));

        expect(h.pane().onEvent(Event::resizeEvent(50, 12)).has_value());
        expect(h.pane().scrollOffset() == 0_u);
        expect(!h.pane().isScrollLocked());
        expect(!h.pane().selection().isComplete());
        expect(h.pane().cols() == 50_i);
        expect(h.pane().rows() == 12_i);
        expect(h.session().resizes == 1_i);
    };
};

suite process_pane_input_tests = [] {
    "keys are forwarded to a focused running pane"_test = [] {
        PaneHarness h;
        expect(fatal(h.pane().start().has_value()));
        h.pane().setFocused(true);
        (void)h.pane().onEvent(Event::textInput("ls -la"));
        (void)h.pane().onEvent(Event::keyDown(Key::Enter));
        (void)h.pane().onEvent(Event::keyDown(Key::Up));
        (void)h.pane().onEvent(Event::charKey('[', base::ModNone));
        expect(h.session().written == "ls -la\r\x1b[A[");
    };

    "unfocused pane ignores keys"_test = [] {
        PaneHarness h;
        expect(fatal(h.pane().start().has_value()));
        expect(!h.pane().isFocused());
        auto res = h.pane().onEvent(Event::keyDown(Key::Enter));
        expect(res.has_value() && !*res);
        expect(h.session().written.empty());
    };

    "split mouse reports are swallowed"_test = [] {
        PaneHarness h;
        expect(fatal(h.pane().start().has_value()));
        h.pane().setFocused(true);
        auto res = h.pane().onEvent(Event::textInput("<35;10;5M"));
        expect(res.has_value() && *res);
        (void)h.pane().onEvent(Event::textInput("[12;3"));
        expect(h.session().written.empty());
    };

    "paste event writes the text"_test = [] {
        PaneHarness h;
        expect(fatal(h.pane().start().has_value()));
        h.pane().setFocused(true);
        (void)h.pane().onEvent(Event::pasteEvent("echo hi"));
        expect(h.session().written == "echo hi");
    };

    "Ctrl+V pastes from the clipboard"_test = [] {
        PaneHarness h;
        expect(fatal(h.pane().start().has_value()));
        h.pane().setFocused(true);
        h.clipboard().pasteText = "pwd";
        (void)h.pane().onEvent(Event::charKey('v', base::ModCtrl));
        expect(h.session().written == "pwd");
    };

    "clipboard contents arriving later go to the session"_test = [] {
        PaneHarness h;
        expect(fatal(h.pane().start().has_value()));
        h.pane().setFocused(true);
        h.clipboard().holdPaste = true;
        h.clipboard().pasteText = "ls";
        (void)h.pane().onEvent(Event::charKey('v', base::ModCtrl));
        expect(h.session().written.empty()) << "nothing is written until the tool answers";
        h.clipboard().completePaste();
        expect(h.session().written == "ls");
    };

    "late clipboard contents are dropped after a restart"_test = [] {
        PaneHarness h(RestartPolicy::shell());
        expect(fatal(h.pane().start().has_value()));
        h.pane().setFocused(true);
        h.clipboard().holdPaste = true;
        h.clipboard().pasteText = "rm -rf build";
        (void)h.pane().onEvent(Event::charKey('v', base::ModCtrl));

        h.session().exit("exit status 1");
        expect(fatal(h.sessions.size() == 2_u));
        h.clipboard().completePaste();
        expect(h.session().written.empty()) << "the new shell never asked for it";
    };

    "Ctrl+C without a selection interrupts the process"_test = [] {
        PaneHarness h;
        expect(fatal(h.pane().start().has_value()));
        h.pane().setFocused(true);
        (void)h.pane().onEvent(Event::charKey('c', base::ModCtrl));
        expect(h.session().written == "\x03");
        expect(h.clipboard().copied.empty());
    };

    "terminal replies go back to the process"_test = [] {
        PaneHarness h;
        expect(fatal(h.pane().start().has_value()));
        h.session().emit("ab\x1b[6n");
        expect(h.session().written == "\x1b[1;3R");
    };

    "focus shows the cursor"_test = [] {
        PaneHarness h;
        expect(fatal(h.pane().start().has_value()));
        h.session().emit("$ ");
        expect(h.frame().find("\x1b[7m") == std::string::npos);
        h.pane().setFocused(true);
        expect(h.frame().find("\x1b[7m \x1b[0m") != std::string::npos);
    };
};

suite process_pane_selection_tests = [] {
    "drag then Ctrl+C copies and clears"_test = [] {
        PaneHarness h;
        expect(fatal(h.pane().start().has_value()));
        h.pane().setFocused(true);
        h.session().emit("hello world\r\n");

        (void)h.pane().onEvent(down(0, 0));
        (void)h.pane().onEvent(drag(3, 0));
        expect(h.pane().selection().isActive());
        (void)h.pane().onEvent(up(5, 0));
        expect(h.pane().selection().hasSelection());

        (void)h.pane().onEvent(Event::charKey('c', base::ModCtrl));
        expect(fatal(h.clipboard().copied.size() == 1_u));
        expect(h.clipboard().copied[0] == "hello");
        expect(!h.pane().selection().hasSelection());
        expect(h.session().written.empty()) << "the copy key is not forwarded";
    };

    "y copies a selection"_test = [] {
        PaneHarness h;
        expect(fatal(h.pane().start().has_value()));
        h.pane().setFocused(true);
        h.session().emit("first\r\nsecond\r\n");
        (void)h.pane().onEvent(down(2, 0));
        (void)h.pane().onEvent(up(3, 1));
        (void)h.pane().onEvent(Event::charKey('y', base::ModNone));
        expect(fatal(h.clipboard().copied.size() == 1_u));
        expect(h.clipboard().copied[0] == "rst\nsec");
    };

    "Escape clears the selection"_test = [] {
        PaneHarness h;
        expect(fatal(h.pane().start().has_value()));
        h.pane().setFocused(true);
        h.session().emit("hello\r\n");
        (void)h.pane().onEvent(down(0, 0));
        (void)h.pane().onEvent(up(4, 0));
        (void)h.pane().onEvent(Event::keyDown(Key::Escape));
        expect(!h.pane().selection().isComplete());
        expect(h.session().written.empty());
    };

    "selection in the scrolled view reads history"_test = [] {
        PaneHarness h(RestartPolicy::shell(), 40, 10);
        expect(fatal(h.pane().start().has_value()));
        h.pane().setFocused(true);
        h.emitLines(59);
        wheel(h.pane(), 1, 1);
        expect(h.pane().scrollOffset() == 3_u);

        // Row 1 of the view is history line 48
        (void)h.pane().onEvent(down(0, 1));
        (void)h.pane().onEvent(up(7, 1));
        (void)h.pane().onEvent(Event::charKey('y', base::ModCtrl));
        expect(fatal(h.clipboard().copied.size() == 1_u));
        expect(h.clipboard().copied[0] == "line 48");
    };

    "selected cells are highlighted"_test = [] {
        PaneHarness h;
        expect(fatal(h.pane().start().has_value()));
        h.session().emit("hello world");
        (void)h.pane().onEvent(down(6, 0));
        (void)h.pane().onEvent(drag(11, 0));
        expect(h.pane().view().find("\x1b[7mworld\x1b[0m") != std::string::npos);
    };

    "copy after wide glyphs takes the highlighted cells"_test = [] {
        PaneHarness h;
        expect(fatal(h.pane().start().has_value()));
        h.pane().setFocused(true);
        // Each glyph takes two cells: a and b sit in columns 4 and 5
        h.session().emit("\xe4\xb8\xad\xe6\x96\x87ab\r\n");

        (void)h.pane().onEvent(down(4, 0));
        (void)h.pane().onEvent(drag(6, 0));
        expect(h.pane().view().find("\x1b[7mab\x1b[0m") != std::string::npos);
        (void)h.pane().onEvent(up(6, 0));
        (void)h.pane().onEvent(Event::charKey('c', base::ModCtrl));
        expect(fatal(h.clipboard().copied.size() == 1_u));
        expect(h.clipboard().copied[0] == "ab");

        (void)h.pane().onEvent(down(2, 0));
        (void)h.pane().onEvent(up(4, 0));
        (void)h.pane().onEvent(Event::charKey('y', base::ModNone));
        expect(fatal(h.clipboard().copied.size() == 2_u));
        expect(h.clipboard().copied[1] == "\xe6\x96\x87");
    };

    "failed copy still clears and keeps the process running"_test = [] {
        PaneHarness h;
        expect(fatal(h.pane().start().has_value()));
        h.pane().setFocused(true);
        h.clipboard().copyError = "no clipboard tool and no terminal";
        h.session().emit("hello world\r\n");

        (void)h.pane().onEvent(down(0, 0));
        (void)h.pane().onEvent(up(5, 0));
        expect(fatal(h.pane().selection().hasSelection()));
        expect(h.pane().copySelection().has_value()) << "clipboard failures are not errors";
        expect(h.clipboard().copied.size() == 1_u);
        expect(!h.pane().selection().hasSelection());
        expect(h.pane().isRunning());

        (void)h.pane().onEvent(down(0, 0));
        (void)h.pane().onEvent(up(5, 0));
        auto handled = h.pane().onEvent(Event::charKey('c', base::ModCtrl));
        expect(handled.has_value());
        expect(!h.pane().selection().hasSelection());
        expect(h.session().written.empty()) << "Ctrl+C with a selection never reaches the process";
        expect(h.pane().isRunning());
    };
};
