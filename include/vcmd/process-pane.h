#pragma once

#include <vcmd/ansi-encoder.h>
#include <vcmd/base/event-listener.h>
#include <vcmd/clipboard.h>
#include <vcmd/process-session.h>
#include <vcmd/render-scheduler.h>
#include <vcmd/scrollback.h>
#include <vcmd/selection.h>
#include <vcmd/style-palette.h>
#include <vcmd/virtual-screen.h>
#include <functional>
#include <memory>
#include <string>

namespace vcmd {

class Config;

// Shell role: restarted after every exit, no reserved rows.
// Command role (AI assistant): stays stopped, one row reserved for the status line.
struct RestartPolicy {
    bool autoRestart = true;
    int reservedRows = 0;

    static RestartPolicy shell() { return {true, 0}; }
    static RestartPolicy command() { return {false, 1}; }
};

struct ProcessPaneConfig {
    std::string name = "terminal";
    RestartPolicy policy = RestartPolicy::shell();
    SpawnConfig spawn;

    size_t scrollbackLines = ScrollbackStore::DEFAULT_CAPACITY;
    size_t dedupWindow = ScrollbackStore::DEFAULT_DEDUP_WINDOW;
    int scrollStep = 3;
    // Border cells between the pane's origin and its first text cell
    int chromeTop = 1;
    int chromeLeft = 1;
    RenderSchedulerConfig render;
    StylePalette palette;

    // Shell command from shell/command, else $SHELL, else /bin/sh
    static ProcessPaneConfig fromConfig(const Config& config, RestartPolicy policy);
};

//=============================================================================
// ProcessPane - interactive process pane
//
// Owns the virtual screen, scrollback, selection and render cache of one
// child process; translates UI events into pty writes and view changes.
// All methods run on the loop thread.
//=============================================================================

class ProcessPane : public base::EventListener {
public:
    using Ptr = std::shared_ptr<ProcessPane>;
    using SessionFactory = std::function<Result<ProcessSession::Ptr>(VirtualScreen::Ptr screen)>;
    using ExitHook = std::function<void(const std::string& exitError)>;

    static Result<Ptr> create(ProcessPaneConfig config, SessionFactory sessionFactory,
                              TickSource::Ptr ticks, Clipboard::Ptr clipboard = nullptr) noexcept;

    ~ProcessPane() override = default;

    const char* typeName() const override { return "ProcessPane"; }

    // Spawn the configured command. A spawn failure is written into the
    // screen in the palette's error style and leaves the pane stopped.
    Result<void> start();
    Result<void> stop();

    // Replace what start() launches next
    void setSpawnConfig(SpawnConfig spawn) { _config.spawn = std::move(spawn); }
    const ProcessPaneConfig& config() const { return _config; }

    // Text area of the pane, reserved rows included
    Result<void> resize(int width, int height);
    void setFocused(bool focused);
    bool isFocused() const { return _focused; }

    // KeyDown, Text, Paste, MouseDown/Drag/Up, Scroll, Resize
    Result<bool> onEvent(const base::Event& event) override;

    bool isRunning() const { return _running; }
    const std::string& exitError() const { return _exitError; }
    bool hasStarted() const { return _started; }
    // "running: <cmd>", "exited: <error>", "exited"
    std::string statusLine() const;

    size_t scrollOffset() const { return _scrollOffset; }
    bool isScrollLocked() const { return _scrollLocked; }
    void scrollBy(int delta);
    void scrollToTop();
    void scrollToBottom();
    int pageSize() const;

    // Screen columns/rows; 0 before the first start
    int cols() const { return _screen ? _screen->cols() : 0; }
    int rows() const { return _screen ? _screen->rows() : 0; }

    const ScrollbackStore& scrollback() const { return _scrollback; }
    const SelectionModel& selection() const { return _selection; }
    VirtualScreen::Ptr screen() const { return _screen; }
    RenderScheduler& renderer() { return *_render; }

    // Clipboard failures are logged; neither call fails on them
    Result<void> copySelection();
    // Contents arrive asynchronously and go to the session that asked
    Result<void> pasteFromClipboard();

    const std::string& view() { return _render->frame(); }

    void setExitHook(ExitHook hook) { _exitHook = std::move(hook); }
    void setFrameHook(RenderScheduler::FrameHook hook) { _render->setFrameHook(std::move(hook)); }

protected:
    Result<void> onShutdown() override;

private:
    ProcessPane(ProcessPaneConfig config, SessionFactory sessionFactory, Clipboard::Ptr clipboard);
    Result<void> init(TickSource::Ptr ticks);

    Result<bool> handleKey(const base::Event& event);
    Result<bool> handleText(const base::Event& event);
    Result<bool> handleMouse(const base::Event& event);
    Result<bool> handleWheel(const base::Event& event);

    void requestNextRead();
    void onReadResult(const ProcessSession::Ptr& session, ReadResult result);
    void onOutput(const std::string& data);
    void onExit(const std::string& exitError);

    void writeToPty(const std::string& bytes);
    void renderStartError(const std::string& message);
    void refreshSelectionContent();
    TextPosition toTextPosition(int x, int y) const;
    std::string composeFrame() const;

    ProcessPaneConfig _config;
    SessionFactory _sessionFactory;
    Clipboard::Ptr _clipboard;
    AnsiEncoder _encoder;

    VirtualScreen::Ptr _screen;
    ProcessSession::Ptr _session;
    ScrollbackStore _scrollback;
    SelectionModel _selection;
    std::unique_ptr<RenderScheduler> _render;

    int _width = 0;
    int _height = 0;
    bool _focused = false;
    bool _running = false;
    bool _started = false;
    bool _stopRequested = false;
    std::string _exitError;

    size_t _scrollOffset = 0;
    bool _scrollLocked = false;

    ExitHook _exitHook;
};

} // namespace vcmd
