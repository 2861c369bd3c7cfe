#include <vcmd/process-pane.h>
#include <vcmd/config.h>
#include <vcmd/key-encoder.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cstdlib>

namespace vcmd {

using base::Event;
using base::Key;

ProcessPaneConfig ProcessPaneConfig::fromConfig(const Config& config, RestartPolicy policy) {
    ProcessPaneConfig pc;
    pc.policy = policy;
    pc.name = policy.autoRestart ? "terminal" : "command";

    std::string shell = config.get<std::string>(Config::KEY_SHELL_COMMAND, "");
    if (shell.empty()) {
        const char* env = std::getenv("SHELL");
        shell = (env && env[0] != '\0') ? env : "/bin/sh";
    }
    pc.spawn.command = shell;
    pc.spawn.args = config.getList(Config::KEY_SHELL_ARGS);
    pc.spawn.env = config.getMap(Config::KEY_SHELL_ENV);

    int lines = config.get<int>(Config::KEY_SCROLLBACK_LINES, static_cast<int>(ScrollbackStore::DEFAULT_CAPACITY));
    int window = config.get<int>(Config::KEY_SCROLLBACK_DEDUP, static_cast<int>(ScrollbackStore::DEFAULT_DEDUP_WINDOW));
    pc.scrollbackLines = static_cast<size_t>(std::max(lines, 1));
    pc.dedupWindow = static_cast<size_t>(std::max(window, 0));
    pc.scrollStep = std::max(config.get<int>(Config::KEY_SCROLL_STEP, 3), 1);

    int interval = config.get<int>(Config::KEY_RENDER_INTERVAL, 50);
    int minInterval = config.get<int>(Config::KEY_RENDER_MIN_INTERVAL, 0);
    pc.render.interval = std::chrono::milliseconds(std::max(interval, 0));
    pc.render.minInterval = std::chrono::milliseconds(std::max(minInterval, 0));

    pc.palette = StylePalette::fromConfig(config);
    return pc;
}

//=============================================================================
// Lifecycle
//=============================================================================

ProcessPane::ProcessPane(ProcessPaneConfig config, SessionFactory sessionFactory, Clipboard::Ptr clipboard)
    : _config(std::move(config))
    , _sessionFactory(std::move(sessionFactory))
    , _clipboard(std::move(clipboard))
    , _encoder(_config.palette)
    , _scrollback(_config.scrollbackLines, _config.dedupWindow) {}

Result<void> ProcessPane::init(TickSource::Ptr ticks) {
    if (!ticks) {
        return Err("ProcessPane: no tick source");
    }
    if (!_sessionFactory) {
        return Err("ProcessPane: no session factory");
    }
    _render = std::make_unique<RenderScheduler>(
        std::move(ticks),
        [this]() { return composeFrame(); },
        [this]() { return _running; },
        _config.render);
    return Ok();
}

Result<ProcessPane::Ptr> ProcessPane::create(ProcessPaneConfig config, SessionFactory sessionFactory,
                                             TickSource::Ptr ticks, Clipboard::Ptr clipboard) noexcept {
    auto pane = Ptr(new ProcessPane(std::move(config), std::move(sessionFactory), std::move(clipboard)));
    if (auto res = pane->init(std::move(ticks)); !res) {
        return Err<Ptr>("Failed to create process pane", res);
    }
    return Ok(std::move(pane));
}

Result<void> ProcessPane::start() {
    if (_running) {
        return Ok();
    }

    int cols = 80;
    int rows = 24;
    if (_width > 0 && _height > 0) {
        cols = _width;
        rows = std::max(_height - _config.policy.reservedRows, 1);
    }

    auto screenRes = VirtualScreen::create(cols, rows);
    if (!screenRes) {
        return Err("ProcessPane::start: no virtual screen", screenRes);
    }
    _screen = *screenRes;
    _selection.clear();
    _scrollOffset = 0;
    _scrollLocked = false;
    _stopRequested = false;
    _exitError.clear();
    _started = true;

    auto sessionRes = _sessionFactory(_screen);
    if (!sessionRes) {
        renderStartError(sessionRes.error().to_string());
        return Ok();
    }
    auto session = *sessionRes;

    SpawnConfig spawn = _config.spawn;
    spawn.cols = cols;
    spawn.rows = rows;
    if (auto res = session->start(spawn); !res) {
        renderStartError(res.error().to_string());
        return Ok();
    }

    _session = session;
    _running = true;
    yinfo("ProcessPane[{}]: started '{}' at {}x{}", _config.name, spawn.command, cols, rows);
    requestNextRead();
    _render->markDirty();
    return Ok();
}

Result<void> ProcessPane::stop() {
    if (!_running || !_session) {
        return Ok();
    }
    yinfo("ProcessPane[{}]: stopping", _config.name);
    _stopRequested = true;
    _running = false;
    auto res = _session->stop();
    _exitError = _session->exitError();
    _render->markDirty();
    if (!res) {
        return Err("ProcessPane::stop failed", res);
    }
    return Ok();
}

Result<void> ProcessPane::onShutdown() {
    return stop();
}

void ProcessPane::renderStartError(const std::string& message) {
    yerror("ProcessPane[{}]: error starting process: {}", _config.name, message);
    _running = false;
    _exitError = message;
    if (_screen) {
        _screen->write(sgr(_config.palette.error) + "Error starting process: " + message + "\x1b[0m\r\n");
    }
    _render->markDirty();
}

std::string ProcessPane::statusLine() const {
    if (_running) {
        return "running: " + _config.spawn.command;
    }
    if (!_started) {
        return {};
    }
    return _exitError.empty() ? "exited" : "exited: " + _exitError;
}

//=============================================================================
// Output path
//=============================================================================

void ProcessPane::requestNextRead() {
    if (!_running || !_session) return;

    std::weak_ptr<ProcessPane> weak = sharedAs<ProcessPane>();
    auto session = _session;
    auto res = session->requestRead([weak, session](ReadResult result) {
        if (auto self = weak.lock()) {
            self->onReadResult(session, std::move(result));
        }
    });
    if (!res) {
        ywarn("ProcessPane[{}]: read request failed: {}", _config.name, error_msg(res));
    }
}

void ProcessPane::onReadResult(const ProcessSession::Ptr& session, ReadResult result) {
    // Late completion from a session that has been replaced
    if (session != _session) {
        ydebug("ProcessPane[{}]: dropping result from a previous session", _config.name);
        return;
    }
    if (result.kind == ReadResult::Kind::Output) {
        onOutput(result.data);
    } else {
        onExit(result.exitError);
    }
}

void ProcessPane::onOutput(const std::string& data) {
    if (!data.empty() && _screen) {
        ScreenSnapshot before = _encoder.snapshot(*_screen);
        _screen->write(data);

        // Terminal replies (DA, DSR) go straight back to the process
        std::string replies = _screen->takeOutput();
        if (!replies.empty()) {
            writeToPty(replies);
        }

        size_t added = _scrollback.capture(before, _encoder.plainRow(*_screen, 0));
        if (_scrollLocked && _scrollOffset > 0 && added > 0) {
            _scrollOffset = std::min(_scrollOffset + added, _scrollback.size());
        }
        _render->markDirty();
    }
    requestNextRead();
}

void ProcessPane::onExit(const std::string& exitError) {
    const bool wasStopped = _stopRequested;
    _stopRequested = false;
    _running = false;
    _exitError = exitError;
    _scrollLocked = false;
    _render->markDirty();

    yinfo("ProcessPane[{}]: process exited{}{}", _config.name,
          exitError.empty() ? "" : ": ", exitError);

    if (_exitHook) {
        _exitHook(exitError);
    }

    if (!wasStopped && _config.policy.autoRestart) {
        yinfo("ProcessPane[{}]: restarting", _config.name);
        if (auto res = start(); !res) {
            yerror("ProcessPane[{}]: restart failed: {}", _config.name, error_msg(res));
        }
    }
}

void ProcessPane::writeToPty(const std::string& bytes) {
    if (bytes.empty() || !_running || !_session) return;
    if (auto res = _session->write(bytes); !res) {
        ydebug("ProcessPane[{}]: write dropped: {}", _config.name, error_msg(res));
    }
}

//=============================================================================
// View
//=============================================================================

std::string ProcessPane::composeFrame() const {
    if (!_screen) return {};

    FrameOverlay overlay;
    overlay.showCursor = _focused;
    overlay.selection = &_selection;
    if (_scrollOffset > 0) {
        return _encoder.encodeScrolled(_scrollback, _scrollOffset, *_screen, overlay);
    }
    return _encoder.encodeLive(*_screen, overlay);
}

Result<void> ProcessPane::resize(int width, int height) {
    _width = width;
    _height = height;
    _scrollOffset = 0;
    _scrollLocked = false;
    _selection.clear();

    const int cols = width;
    const int rows = height - _config.policy.reservedRows;
    Result<void> res = Ok();
    if (_screen && cols > 0 && rows > 0) {
        if (_running && _session) {
            res = _session->resize(cols, rows);
        } else {
            res = _screen->resize(cols, rows);
        }
    }
    if (_screen) {
        _render->renderNow();
    }
    if (!res) {
        return Err("ProcessPane::resize failed", res);
    }
    return Ok();
}

void ProcessPane::setFocused(bool focused) {
    if (_focused == focused) return;
    _focused = focused;
    if (_screen) {
        _render->markDirty();
    }
}

//=============================================================================
// Scrolling
//=============================================================================

int ProcessPane::pageSize() const {
    if (_height <= 0) return 10;
    return std::max(_height - _config.policy.reservedRows - 2, 1);
}

void ProcessPane::scrollBy(int delta) {
    long next = static_cast<long>(_scrollOffset) + delta;
    next = std::clamp(next, 0L, static_cast<long>(_scrollback.size()));
    _scrollOffset = static_cast<size_t>(next);
    _scrollLocked = _scrollOffset > 0;
    if (_screen) {
        _render->renderNow();
    }
}

void ProcessPane::scrollToTop() {
    _scrollOffset = _scrollback.size();
    _scrollLocked = _scrollOffset > 0;
    if (_screen) {
        _render->renderNow();
    }
}

void ProcessPane::scrollToBottom() {
    _scrollOffset = 0;
    _scrollLocked = false;
    if (_screen) {
        _render->renderNow();
    }
}

//=============================================================================
// Selection and clipboard
//=============================================================================

TextPosition ProcessPane::toTextPosition(int x, int y) const {
    int row = std::max(y - _config.chromeTop, 0);
    int col = std::max(x - _config.chromeLeft, 0);
    if (_scrollOffset > 0) {
        // Scrollback rows first, then live rows
        int firstLine = static_cast<int>(_scrollback.size() - _scrollOffset);
        return {firstLine + row, col};
    }
    return {row, col};
}

void ProcessPane::refreshSelectionContent() {
    std::vector<std::string> lines;
    std::vector<std::vector<int>> columnMaps;
    if (_scrollOffset > 0) {
        lines.reserve(_scrollback.size() + (_screen ? _screen->rows() : 0));
        for (const auto& line : _scrollback.lines()) {
            std::string plain = stripAnsi(line);
            while (!plain.empty() && plain.back() == ' ') plain.pop_back();
            lines.push_back(std::move(plain));
        }
    }
    // Scrollback lines keep codepoint columns
    columnMaps.resize(lines.size());
    if (_screen) {
        for (int row = 0; row < _screen->rows(); ++row) {
            std::vector<int> columns;
            lines.push_back(_encoder.plainRow(*_screen, row, &columns));
            columnMaps.push_back(std::move(columns));
        }
    }
    _selection.setContent(std::move(lines), std::move(columnMaps));
}

Result<void> ProcessPane::copySelection() {
    std::string text = _selection.selectedText();
    _selection.clear();
    if (_screen) {
        _render->renderNow();
    }
    if (text.empty() || !_clipboard) {
        return Ok();
    }
    if (auto res = _clipboard->copy(text); !res) {
        ywarn("ProcessPane[{}]: copy failed: {}", _config.name, error_msg(res));
        return Ok();
    }
    ydebug("ProcessPane[{}]: copied {} bytes", _config.name, text.size());
    return Ok();
}

Result<void> ProcessPane::pasteFromClipboard() {
    if (!_clipboard) {
        return Ok();
    }
    std::weak_ptr<ProcessPane> weak = sharedAs<ProcessPane>();
    auto session = _session;
    auto res = _clipboard->requestPaste([weak, session](Result<std::string> text) {
        auto self = weak.lock();
        if (!self) return;
        if (!text) {
            ywarn("ProcessPane[{}]: paste failed: {}", self->_config.name, error_msg(text));
            return;
        }
        // The session may have exited or been replaced while the tool ran
        if (session != self->_session) {
            ydebug("ProcessPane[{}]: dropping paste for a previous session", self->_config.name);
            return;
        }
        self->writeToPty(*text);
    });
    if (!res) {
        ywarn("ProcessPane[{}]: paste failed: {}", _config.name, error_msg(res));
    }
    return Ok();
}

//=============================================================================
// Input
//=============================================================================

Result<bool> ProcessPane::onEvent(const Event& event) {
    switch (event.type) {
        case Event::Type::KeyDown:
            return handleKey(event);
        case Event::Type::Text:
            return handleText(event);
        case Event::Type::Paste:
            if (!_focused || !_running) return Ok(false);
            writeToPty(event.payloadText());
            return Ok(true);
        case Event::Type::MouseDown:
        case Event::Type::MouseDrag:
        case Event::Type::MouseUp:
            return handleMouse(event);
        case Event::Type::Scroll:
            return handleWheel(event);
        case Event::Type::Resize: {
            if (auto res = resize(event.resize.cols, event.resize.rows); !res) {
                return Err<bool>("resize failed", res);
            }
            return Ok(true);
        }
        default:
            return Ok(false);
    }
}

Result<bool> ProcessPane::handleKey(const Event& event) {
    if (!_focused) return Ok(false);

    if (isCopyKey(event) && _selection.hasSelection()) {
        if (auto res = copySelection(); !res) {
            return Err<bool>("copy failed", res);
        }
        return Ok(true);
    }
    if (isPasteKey(event)) {
        if (!_running) return Ok(false);
        if (auto res = pasteFromClipboard(); !res) {
            return Err<bool>("paste failed", res);
        }
        return Ok(true);
    }

    const Key key = event.key.key;
    const int mods = event.key.mods;

    if (key == Key::Escape && (_selection.isActive() || _selection.isComplete())) {
        _selection.clear();
        _render->renderNow();
        return Ok(true);
    }
    if (mods == base::ModNone) {
        if (key == Key::End && _scrollOffset > 0) {
            scrollToBottom();
            return Ok(true);
        }
        if (key == Key::Home && !_scrollback.empty()) {
            scrollToTop();
            return Ok(true);
        }
        if ((key == Key::PageUp || key == Key::PageDown) && (_scrollOffset > 0 || !_running)) {
            scrollBy(key == Key::PageUp ? pageSize() : -pageSize());
            return Ok(true);
        }
    }

    if (!_running) return Ok(false);

    std::string bytes = encodeKey(key, mods, event.key.codepoint);
    if (bytes.empty()) return Ok(false);
    writeToPty(bytes);
    return Ok(true);
}

Result<bool> ProcessPane::handleText(const Event& event) {
    if (!_focused) return Ok(false);

    if (isCopyKey(event) && _selection.hasSelection()) {
        if (auto res = copySelection(); !res) {
            return Err<bool>("copy failed", res);
        }
        return Ok(true);
    }
    if (!_running) return Ok(false);

    // Fragments of split mouse/escape sequences are swallowed, not typed
    std::string bytes = encodeText(event.payloadText(), event.text.mods);
    if (!bytes.empty()) {
        writeToPty(bytes);
    }
    return Ok(true);
}

Result<bool> ProcessPane::handleMouse(const Event& event) {
    if (event.mouse.button != base::MouseButton::Left) return Ok(false);
    if (!_screen) return Ok(false);

    TextPosition pos = toTextPosition(event.mouse.x, event.mouse.y);
    switch (event.type) {
        case Event::Type::MouseDown:
            refreshSelectionContent();
            _selection.start(pos.line, pos.col);
            break;
        case Event::Type::MouseDrag:
            if (!_selection.isActive()) return Ok(false);
            _selection.update(pos.line, pos.col);
            break;
        case Event::Type::MouseUp:
            if (!_selection.isActive()) return Ok(false);
            _selection.update(pos.line, pos.col);
            _selection.end();
            break;
        default:
            return Ok(false);
    }
    _render->renderNow();
    return Ok(true);
}

Result<bool> ProcessPane::handleWheel(const Event& event) {
    if (event.scroll.dy == 0) return Ok(false);
    scrollBy(event.scroll.dy > 0 ? _config.scrollStep : -_config.scrollStep);
    return Ok(true);
}

} // namespace vcmd
