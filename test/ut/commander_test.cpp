//=============================================================================
// Commander Tests
//
// Covers: layout, box drawing, global keys and routing without a pane,
// terminal writes on a non-blocking descriptor.
// Nothing here spawns a process or touches the real terminal.
//=============================================================================

#include <boost/ut.hpp>
#include <vcmd/ansi-encoder.h>
#include <vcmd/commander.h>
#include <cstdlib>
#include <fcntl.h>
#include <thread>
#include <unistd.h>

using namespace boost::ut;
using namespace vcmd;
using base::Event;
using base::Key;

namespace {

Commander::Ptr makeCommander(std::string& output) {
    ::setenv("XDG_CONFIG_HOME", "/nonexistent/vcmd-commander-test", 1);
    auto config = Config::create();
    ::unsetenv("XDG_CONFIG_HOME");
    auto loop = base::EventLoop::instance();
    if (!config || !loop) return nullptr;
    auto res = Commander::create(*config, *loop,
                                 [&output](const std::string& s) { output += s; });
    return res ? *res : nullptr;
}

} // namespace

suite commander_layout_tests = [] {
    "layout without the mini-buffer"_test = [] {
        auto layout = Layout::compute(80, 25, false);
        expect(!layout.miniBufferVisible);
        expect(layout.content.width == 80_i);
        expect(layout.content.height == 24_i);
        expect(layout.statusBar.y == 24_i);
        expect(layout.statusBar.height == 1_i);
        expect(layout.miniBuffer.height == 0_i);
    };

    "mini-buffer takes a third"_test = [] {
        auto layout = Layout::compute(80, 25, true);
        expect(layout.miniBuffer.height == 8_i);
        expect(layout.miniBuffer.y == 16_i);
        expect(layout.content.height == 16_i);
    };

    "small terminal splits in half"_test = [] {
        auto layout = Layout::compute(40, 8, true);
        expect(layout.miniBuffer.height == 3_i);
        expect(layout.content.height == 4_i);
        expect(layout.statusBar.y == 7_i);
    };

    "rect containment"_test = [] {
        Rect r{2, 3, 4, 5};
        expect(r.contains(2, 3));
        expect(r.contains(5, 7));
        expect(!r.contains(6, 3));
        expect(!r.contains(2, 8));
        expect(!r.contains(1, 4));
    };

    "box drawing"_test = [] {
        std::string box = drawBox(Rect{0, 0, 6, 3}, "ab", false, {"x"});
        expect(box == "\x1b[1;1H┌ ab ┐\x1b[2;1H│x   │\x1b[3;1H└────┘") << box;
        expect(drawBox(Rect{0, 0, 1, 5}, "t", false, {}).empty());
    };

    "focused box uses the highlight colour"_test = [] {
        std::string box = drawBox(Rect{1, 1, 4, 2}, "", true, {});
        expect(box.find("\x1b[1;36m") != std::string::npos);
        expect(box.find("\x1b[2;2H") == 0_u);
    };
};

suite commander_tests = [] {
    "ctrl+q quits"_test = [] {
        std::string output;
        auto commander = makeCommander(output);
        expect(fatal(commander != nullptr));
        expect(!commander->isQuitting());
        auto res = commander->handleInput(Event::charKey('q', base::ModCtrl));
        expect(res.has_value() && *res);
        expect(commander->isQuitting());
        expect(commander->shutdown().has_value());
    };

    "alt+2 focuses the content box"_test = [] {
        std::string output;
        auto commander = makeCommander(output);
        expect(fatal(commander != nullptr));
        commander->focus(Commander::Focus::MiniBuffer);
        auto res = commander->handleInput(Event::charKey('2', base::ModAlt));
        expect(res.has_value() && *res);
        expect(commander->focused() == Commander::Focus::Content);
        expect(commander->shutdown().has_value());
    };

    "input without panes is not handled"_test = [] {
        std::string output;
        auto commander = makeCommander(output);
        expect(fatal(commander != nullptr));
        auto key = commander->handleInput(Event::charKey('x', base::ModNone));
        expect(key.has_value() && !*key);
        auto click = commander->handleInput(Event::mouseDown(3, 3));
        expect(click.has_value() && !*click);
        expect(commander->shutdown().has_value());
    };

    "default provider comes from config"_test = [] {
        std::string output;
        auto commander = makeCommander(output);
        expect(fatal(commander != nullptr));
        expect(commander->providers().defaultName() == "claude-code");
        expect(commander->aiPane() == nullptr) << "no pane before launch";
        expect(commander->shellPane() == nullptr);
        expect(commander->shutdown().has_value());
    };

    "screen shows the hint before launch"_test = [] {
        std::string output;
        auto commander = makeCommander(output);
        expect(fatal(commander != nullptr));
        expect(commander->resize(60, 20).has_value());
        std::string screen = stripAnsi(commander->composeScreen());
        expect(screen.find("Alt+A  launch claude-code") != std::string::npos);
        expect(screen.find("Ctrl+Q quit") != std::string::npos);
        expect(output.empty()) << "nothing is drawn outside raw mode";
        expect(commander->shutdown().has_value());
    };
};

suite commander_output_tests = [] {
    "full non-blocking descriptor waits for the reader"_test = [] {
        int fds[2];
        expect(fatal(::pipe2(fds, O_NONBLOCK | O_CLOEXEC) == 0));
        // Several pipe buffers' worth, so writes hit EAGAIN
        const std::string data(1 << 20, 'x');

        std::string received;
        std::thread reader([&] {
            int flags = ::fcntl(fds[0], F_GETFL);
            ::fcntl(fds[0], F_SETFL, flags & ~O_NONBLOCK);
            char buf[4096];
            ssize_t n;
            while ((n = ::read(fds[0], buf, sizeof(buf))) > 0) {
                received.append(buf, static_cast<size_t>(n));
            }
        });

        auto res = writeAll(fds[1], data);
        ::close(fds[1]);
        reader.join();
        ::close(fds[0]);
        expect(res.has_value()) << error_msg(res);
        expect(received.size() == data.size());
    };

    "write errors are reported"_test = [] {
        auto res = writeAll(-1, "x");
        expect(!res.has_value());
        expect(error_msg(res).find("write failed") != std::string::npos);
    };
};
