#include <vcmd/commander.h>
#include <vcmd/ansi-encoder.h>
#include <vcmd/style-palette.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace vcmd {

using base::Event;
using base::Key;

namespace {

// Alternate screen, hidden cursor, SGR mouse with drag, bracketed paste
constexpr const char* TERMINAL_ENTER = "\x1b[?1049h\x1b[?25l\x1b[?1000h\x1b[?1002h\x1b[?1006h\x1b[?2004h";
constexpr const char* TERMINAL_LEAVE = "\x1b[?2004l\x1b[?1006l\x1b[?1002l\x1b[?1000l\x1b[?25h\x1b[?1049l";

constexpr int ESC_FLUSH_MS = 25;
constexpr const char* FOCUS_BORDER_SGR = "1;36";

// stdout shares the tty description that libuv made non-blocking for stdin
void writeStdout(const std::string& data) {
    if (auto res = writeAll(STDOUT_FILENO, data); !res) {
        ydebug("Commander: terminal write failed: {}", error_msg(res));
    }
}

std::string moveTo(int x, int y) {
    return "\x1b[" + std::to_string(y + 1) + ";" + std::to_string(x + 1) + "H";
}

std::string repeat(const std::string& s, int n) {
    std::string out;
    for (int i = 0; i < n; ++i) out += s;
    return out;
}

Event translateMouse(const Event& event, const Rect& box) {
    Event local = event;
    if (event.type == Event::Type::Scroll) {
        local.scroll.x -= box.x;
        local.scroll.y -= box.y;
    } else {
        local.mouse.x -= box.x;
        local.mouse.y -= box.y;
    }
    return local;
}

} // namespace

//=============================================================================
// Layout
//=============================================================================

Layout Layout::compute(int cols, int rows, bool miniBufferVisible) {
    Layout layout;
    cols = std::max(cols, 0);
    rows = std::max(rows, 0);
    const int available = std::max(rows - 1, 0);

    layout.statusBar = {0, available, cols, rows > 0 ? 1 : 0};
    layout.miniBufferVisible = miniBufferVisible;

    int miniHeight = 0;
    if (miniBufferVisible) {
        miniHeight = available >= 9 ? available / 3 : available / 2;
    }
    layout.content = {0, 0, cols, available - miniHeight};
    layout.miniBuffer = {0, available - miniHeight, cols, miniHeight};
    return layout;
}

Result<void> writeAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n >= 0) {
            off += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            return Err(std::string("write failed: ") + std::strerror(errno));
        }
        struct pollfd pfd = {fd, POLLOUT, 0};
        if (::poll(&pfd, 1, -1) < 0 && errno != EINTR) {
            return Err(std::string("poll failed: ") + std::strerror(errno));
        }
    }
    return Ok();
}

std::string drawBox(const Rect& box, const std::string& title, bool focused,
                    const std::vector<std::string>& body) {
    if (box.width < 2 || box.height < 2) return {};

    const std::string border = focused ? sgr(FOCUS_BORDER_SGR) : std::string();
    const std::string reset = focused ? "\x1b[0m" : "";
    const int inner = box.width - 2;

    std::string out;
    std::string top = title.empty() ? std::string() : " " + title + " ";
    if (displayWidth(top) > inner) top = fitToWidth(top, inner);
    out += moveTo(box.x, box.y) + border + "┌" + top
        + repeat("─", inner - displayWidth(top)) + "┐" + reset;

    for (int row = 0; row < box.height - 2; ++row) {
        const std::string line = row < static_cast<int>(body.size()) ? body[row] : std::string();
        out += moveTo(box.x, box.y + 1 + row) + border + "│" + reset
            + fitToWidth(line, inner) + border + "│" + reset;
    }
    out += moveTo(box.x, box.y + box.height - 1) + border + "└" + repeat("─", inner) + "┘" + reset;
    return out;
}

//=============================================================================
// Commander
//=============================================================================

Commander::Commander(Config::Ptr config, base::EventLoop::Ptr loop, Output output)
    : _config(std::move(config))
    , _loop(std::move(loop))
    , _output(output ? std::move(output) : Output(writeStdout))
    , _providers(AiProviderRegistry::withBuiltins()) {}

Result<Commander::Ptr> Commander::create(Config::Ptr config, base::EventLoop::Ptr loop,
                                         Output output) noexcept {
    if (!config) {
        return Err<Ptr>("Commander: no config");
    }
    if (!loop) {
        return Err<Ptr>("Commander: no event loop");
    }
    auto commander = Ptr(new Commander(std::move(config), std::move(loop), std::move(output)));
    if (auto res = commander->init(); !res) {
        return Err<Ptr>("Failed to create commander", res);
    }
    return Ok(std::move(commander));
}

Result<void> Commander::init() {
    auto clipboardRes = Clipboard::create(_output, _loop);
    if (!clipboardRes) {
        return Err("Commander: no clipboard", clipboardRes);
    }
    _clipboard = *clipboardRes;

    const std::string provider = _config->get<std::string>(Config::KEY_AI_PROVIDER, "");
    if (!provider.empty()) {
        if (auto res = _providers.setDefault(provider); !res) {
            ywarn("Commander: {}, using {}", error_msg(res), _providers.defaultName());
        }
    }
    _aiProviderName = _providers.defaultName();

    _layout = Layout::compute(_cols, _rows, _miniBufferVisible);
    return Ok();
}

Result<ProcessPane::Ptr> Commander::createPane(RestartPolicy policy, const std::string& role) {
    auto ticksRes = TickSource::create(_loop);
    if (!ticksRes) {
        return Err<ProcessPane::Ptr>("no tick source", ticksRes);
    }

    auto loop = _loop;
    auto factory = [loop](VirtualScreen::Ptr screen) {
        return ProcessSession::create(loop, std::move(screen));
    };

    ProcessPaneConfig paneConfig = ProcessPaneConfig::fromConfig(*_config, policy);
    paneConfig.name = role;
    auto paneRes = ProcessPane::create(std::move(paneConfig), factory, *ticksRes, _clipboard);
    if (!paneRes) {
        return Err<ProcessPane::Ptr>("failed to create " + role + " pane", paneRes);
    }
    auto pane = *paneRes;

    std::weak_ptr<Commander> weak = sharedAs<Commander>();
    pane->setFrameHook([weak](const std::string&, bool replaced) {
        if (!replaced) return;
        if (auto self = weak.lock()) {
            self->redraw();
        }
    });
    pane->setExitHook([weak, role](const std::string& exitError) {
        auto self = weak.lock();
        if (!self) return;
        self->_notice = role + (exitError.empty() ? " exited" : " exited: " + exitError);
        if (self->_notify) {
            self->_notify(Notification::SessionExited, role, exitError);
        }
        self->redraw();
    });
    return Ok(std::move(pane));
}

Result<void> Commander::ensureShell() {
    if (!_shellPane) {
        auto paneRes = createPane(RestartPolicy::shell(), "shell");
        if (!paneRes) {
            return Err("Commander: shell pane", paneRes);
        }
        _shellPane = *paneRes;
    }
    const Rect& box = _layout.miniBuffer;
    if (box.width > 2 && box.height > 2) {
        if (auto res = _shellPane->resize(box.width - 2, box.height - 2); !res) {
            ywarn("Commander: shell resize: {}", error_msg(res));
        }
    }
    if (!_shellPane->isRunning()) {
        if (auto res = _shellPane->start(); !res) {
            return Err("Commander: failed to start shell", res);
        }
    }
    return Ok();
}

Result<void> Commander::launchAi(const std::string& providerName) {
    auto providerRes = _providers.get(providerName.empty() ? _aiProviderName : providerName);
    if (!providerRes) {
        _notice = error_msg(providerRes);
        redraw();
        return Err("Commander: no AI provider", providerRes);
    }
    auto provider = *providerRes;

    if (!_aiPane) {
        auto paneRes = createPane(RestartPolicy::command(), "ai");
        if (!paneRes) {
            return Err("Commander: AI pane", paneRes);
        }
        _aiPane = *paneRes;
    }
    focus(Focus::Content);
    if (_aiPane->isRunning()) {
        return Ok();
    }

    AiOptions options;
    std::error_code ec;
    options.workingDir = std::filesystem::current_path(ec).string();
    options.model = _config->get<std::string>(Config::KEY_AI_MODEL, "");
    options.systemPrompt = _config->get<std::string>(Config::KEY_AI_SYSTEM_PROMPT, "");
    options.additionalArgs = _config->getList(Config::KEY_AI_ARGS);

    SpawnConfig spawn = provider->spawnConfig(options);
    for (const auto& kv : _config->getMap(Config::KEY_SHELL_ENV)) {
        spawn.env.push_back(kv);
    }
    _aiPane->setSpawnConfig(std::move(spawn));
    _aiProviderName = provider->name();

    const Rect& box = _layout.content;
    if (box.width > 2 && box.height > 2) {
        if (auto res = _aiPane->resize(box.width - 2, box.height - 2); !res) {
            ywarn("Commander: AI pane resize: {}", error_msg(res));
        }
    }
    yinfo("Commander: launching {}", provider->name());
    if (auto res = _aiPane->start(); !res) {
        return Err("Commander: failed to start " + provider->name(), res);
    }
    redraw();
    return Ok();
}

Result<void> Commander::toggleMiniBuffer() {
    if (_miniBufferVisible && _focus == Focus::MiniBuffer) {
        _miniBufferVisible = false;
        focus(Focus::Content);
        return resize(_cols, _rows);
    }
    if (!_miniBufferVisible) {
        _miniBufferVisible = true;
        if (auto res = resize(_cols, _rows); !res) {
            return res;
        }
    }
    focus(Focus::MiniBuffer);
    if (auto res = ensureShell(); !res) {
        return res;
    }
    redraw();
    return Ok();
}

void Commander::focus(Focus target) {
    _focus = target;
    if (_aiPane) _aiPane->setFocused(target == Focus::Content);
    if (_shellPane) _shellPane->setFocused(target == Focus::MiniBuffer && _miniBufferVisible);
    redraw();
}

Result<void> Commander::resize(int cols, int rows) {
    _cols = cols;
    _rows = rows;
    _layout = Layout::compute(cols, rows, _miniBufferVisible);
    ydebug("Commander: layout {}x{} content {}x{} mini {}x{}", cols, rows,
           _layout.content.width, _layout.content.height,
           _layout.miniBuffer.width, _layout.miniBuffer.height);

    Result<void> res = Ok();
    const Rect& content = _layout.content;
    if (_aiPane && content.width > 2 && content.height > 2) {
        res = _aiPane->resize(content.width - 2, content.height - 2);
    }
    const Rect& mini = _layout.miniBuffer;
    if (res && _shellPane && _miniBufferVisible && mini.width > 2 && mini.height > 2) {
        res = _shellPane->resize(mini.width - 2, mini.height - 2);
    }
    redraw();
    if (!res) {
        return Err("Commander::resize failed", res);
    }
    return Ok();
}

Result<void> Commander::quit() {
    if (_quitting) return Ok();
    yinfo("Commander: quitting");
    _quitting = true;
    return _loop->stop();
}

Result<void> Commander::onShutdown() {
    Result<void> res = Ok();
    if (_aiPane) {
        if (auto r = _aiPane->shutdown(); !r) res = r;
    }
    if (_shellPane) {
        if (auto r = _shellPane->shutdown(); !r) res = r;
    }
    if (_stdinPoll >= 0) {
        if (auto r = _loop->destroyPoll(_stdinPoll); !r) ywarn("Commander: {}", error_msg(r));
        _stdinPoll = -1;
    }
    if (_flushTimer >= 0) {
        if (auto r = _loop->destroyTimer(_flushTimer); !r) ywarn("Commander: {}", error_msg(r));
        _flushTimer = -1;
    }
    if (_winchSignal >= 0) {
        if (auto r = _loop->unwatchSignal(_winchSignal); !r) ywarn("Commander: {}", error_msg(r));
        _winchSignal = -1;
    }
    restoreTerminal();
    return res;
}

//=============================================================================
// Host terminal
//=============================================================================

Result<void> Commander::enterRawMode() {
    if (!isatty(STDIN_FILENO)) {
        return Err("Commander: stdin is not a terminal");
    }
    if (tcgetattr(STDIN_FILENO, &_savedTermios) != 0) {
        return Err(std::string("tcgetattr failed: ") + std::strerror(errno));
    }
    struct termios raw = _savedTermios;
    cfmakeraw(&raw);
    if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) {
        return Err(std::string("tcsetattr failed: ") + std::strerror(errno));
    }
    _rawMode = true;
    _output(TERMINAL_ENTER);
    return Ok();
}

void Commander::restoreTerminal() {
    if (!_rawMode) return;
    _output(TERMINAL_LEAVE);
    if (tcsetattr(STDIN_FILENO, TCSANOW, &_savedTermios) != 0) {
        ywarn("Commander: failed to restore terminal: {}", std::strerror(errno));
    }
    _rawMode = false;
}

Result<void> Commander::run() {
    auto self = sharedAs<Commander>();

    struct winsize ws = {};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        _cols = ws.ws_col;
        _rows = ws.ws_row;
    }

    if (auto res = enterRawMode(); !res) {
        return res;
    }

    auto pollRes = _loop->createPoll();
    if (!pollRes) {
        restoreTerminal();
        return Err("Commander: stdin poll", pollRes);
    }
    _stdinPoll = *pollRes;
    if (auto res = _loop->configPoll(_stdinPoll, STDIN_FILENO); !res) {
        restoreTerminal();
        return res;
    }
    if (auto res = _loop->registerPollListener(_stdinPoll, self); !res) {
        restoreTerminal();
        return res;
    }
    if (auto res = _loop->startPoll(_stdinPoll); !res) {
        restoreTerminal();
        return res;
    }

    auto timerRes = _loop->createTimer();
    if (!timerRes) {
        restoreTerminal();
        return Err("Commander: flush timer", timerRes);
    }
    _flushTimer = *timerRes;
    if (auto res = _loop->configTimer(_flushTimer, ESC_FLUSH_MS, false); !res) {
        restoreTerminal();
        return res;
    }
    if (auto res = _loop->registerTimerListener(_flushTimer, self); !res) {
        restoreTerminal();
        return res;
    }

    auto signalRes = _loop->watchSignal(SIGWINCH, self);
    if (!signalRes) {
        ywarn("Commander: no SIGWINCH handling: {}", error_msg(signalRes));
    } else {
        _winchSignal = *signalRes;
    }

    if (auto res = resize(_cols, _rows); !res) {
        ywarn("Commander: {}", error_msg(res));
    }
    focus(Focus::Content);

    yinfo("Commander: running at {}x{}", _cols, _rows);
    _loop->start();

    return shutdown();
}

Result<void> Commander::readStdin() {
    char buf[4096];
    ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n > 0) {
        feedInput(buf, static_cast<size_t>(n));
        return Ok();
    }
    if (n == 0) {
        yinfo("Commander: stdin closed");
        return quit();
    }
    if (errno == EINTR || errno == EAGAIN) {
        return Ok();
    }
    return Err(std::string("stdin read failed: ") + std::strerror(errno));
}

void Commander::feedInput(const char* data, size_t len) {
    for (const auto& event : _decoder.feed(data, len)) {
        if (auto res = handleInput(event); !res) {
            yerror("Commander: input: {}", error_msg(res));
        }
    }
    if (_decoder.hasPending() && _flushTimer >= 0) {
        if (auto res = _loop->startTimer(_flushTimer); !res) {
            ywarn("Commander: {}", error_msg(res));
        }
    }
}

Result<bool> Commander::onEvent(const Event& event) {
    switch (event.type) {
        case Event::Type::PollReadable:
            if (event.poll.fd != STDIN_FILENO) return Ok(false);
            if (auto res = readStdin(); !res) {
                return Err<bool>("Commander: stdin", res);
            }
            return Ok(true);

        case Event::Type::Signal: {
            if (event.signal.signum != SIGWINCH) return Ok(false);
            struct winsize ws = {};
            if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
                if (auto res = resize(ws.ws_col, ws.ws_row); !res) {
                    return Err<bool>("Commander: resize", res);
                }
            }
            return Ok(true);
        }

        case Event::Type::Timer:
            if (event.timer.timerId != _flushTimer) return Ok(false);
            for (const auto& input : _decoder.flush()) {
                if (auto res = handleInput(input); !res) {
                    yerror("Commander: input: {}", error_msg(res));
                }
            }
            return Ok(true);

        default:
            return Ok(false);
    }
}

//=============================================================================
// Routing
//=============================================================================

Result<bool> Commander::handleInput(const Event& event) {
    if (event.type == Event::Type::KeyDown && event.key.key == Key::Char) {
        const uint32_t cp = event.key.codepoint;
        const int mods = event.key.mods;
        if (mods == base::ModCtrl && cp == 'q') {
            if (auto res = quit(); !res) return Err<bool>("quit failed", res);
            return Ok(true);
        }
        if (mods == base::ModAlt) {
            if (cp == '2') {
                focus(Focus::Content);
                return Ok(true);
            }
            if (cp == '3') {
                if (auto res = toggleMiniBuffer(); !res) {
                    _notice = error_msg(res);
                    return Err<bool>("mini-buffer", res);
                }
                return Ok(true);
            }
            if (cp == 'a' || cp == 'A') {
                if (auto res = launchAi(); !res) {
                    _notice = error_msg(res);
                    return Err<bool>("AI launch", res);
                }
                return Ok(true);
            }
        }
    }

    switch (event.type) {
        case Event::Type::Resize:
            if (auto res = resize(event.resize.cols, event.resize.rows); !res) {
                return Err<bool>("resize", res);
            }
            return Ok(true);

        case Event::Type::MouseDown:
        case Event::Type::Scroll: {
            const int x = event.type == Event::Type::Scroll ? event.scroll.x : event.mouse.x;
            const int y = event.type == Event::Type::Scroll ? event.scroll.y : event.mouse.y;
            ProcessPane::Ptr target;
            Rect box;
            if (_layout.content.contains(x, y)) {
                target = _aiPane;
                box = _layout.content;
                if (event.type == Event::Type::MouseDown) focus(Focus::Content);
            } else if (_miniBufferVisible && _layout.miniBuffer.contains(x, y)) {
                target = _shellPane;
                box = _layout.miniBuffer;
                if (event.type == Event::Type::MouseDown) focus(Focus::MiniBuffer);
            }
            if (!target) return Ok(false);
            if (event.type == Event::Type::MouseDown) _mouseTarget = target;
            return target->onEvent(translateMouse(event, box));
        }

        case Event::Type::MouseDrag:
        case Event::Type::MouseUp: {
            auto target = _mouseTarget;
            if (event.type == Event::Type::MouseUp) _mouseTarget.reset();
            if (!target) return Ok(false);
            const Rect& box = target == _aiPane ? _layout.content : _layout.miniBuffer;
            return target->onEvent(translateMouse(event, box));
        }

        default:
            break;
    }

    auto pane = _focus == Focus::Content ? _aiPane : (_miniBufferVisible ? _shellPane : nullptr);
    if (!pane) return Ok(false);
    return pane->onEvent(event);
}

//=============================================================================
// Drawing
//=============================================================================

std::string Commander::contentTitle() const {
    if (_aiPane && _aiPane->hasStarted()) {
        return _aiProviderName;
    }
    return "vcmd";
}

std::string Commander::statusBar() const {
    std::string text = " vcmd";
    if (_aiPane && _aiPane->hasStarted()) {
        text += " | ai: " + _aiPane->statusLine();
    }
    if (_shellPane && _shellPane->hasStarted()) {
        text += " | shell: " + std::string(_shellPane->isRunning() ? "running" : "exited");
    }
    if (!_notice.empty()) {
        text += " | " + _notice;
    }
    text += " | Ctrl+Q quit  Alt+A ai  Alt+2 content  Alt+3 shell ";
    return text;
}

std::string Commander::composeScreen() {
    std::string out = "\x1b[0m";

    std::vector<std::string> body;
    if (_aiPane && _aiPane->hasStarted()) {
        body = splitLines(_aiPane->view());
        const int textRows = _layout.content.height - 2;
        body.resize(static_cast<size_t>(std::max(textRows, 0)));
        if (textRows > 0) {
            // Reserved row of the command-role pane
            body[textRows - 1] = _aiPane->statusLine();
        }
    } else {
        body = {
            "",
            "  Alt+A  launch " + _aiProviderName,
            "  Alt+3  toggle the shell mini-buffer",
            "  Alt+2  focus this box",
            "  Ctrl+Q quit",
        };
    }
    out += drawBox(_layout.content, contentTitle(), _focus == Focus::Content, body);

    if (_miniBufferVisible) {
        std::vector<std::string> shellBody;
        if (_shellPane) {
            shellBody = splitLines(_shellPane->view());
        }
        out += drawBox(_layout.miniBuffer, "shell", _focus == Focus::MiniBuffer, shellBody);
    }

    if (_layout.statusBar.height > 0) {
        out += moveTo(0, _layout.statusBar.y) + sgr("7")
            + fitToWidth(statusBar(), _layout.statusBar.width) + "\x1b[0m";
    }
    return out;
}

void Commander::redraw() {
    if (!_rawMode) return;
    _output(composeScreen());
}

} // namespace vcmd
