#pragma once

#include <vcmd/ai-provider.h>
#include <vcmd/base/event-listener.h>
#include <vcmd/base/event-loop.h>
#include <vcmd/clipboard.h>
#include <vcmd/config.h>
#include <vcmd/host-input.h>
#include <vcmd/process-pane.h>
#include <functional>
#include <memory>
#include <string>
#include <termios.h>

namespace vcmd {

struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool contains(int px, int py) const {
        return px >= x && px < x + width && py >= y && py < y + height;
    }
};

// Content box on top, optional mini-buffer below it, status bar last
struct Layout {
    Rect content;
    Rect miniBuffer;
    Rect statusBar;
    bool miniBufferVisible = false;

    static Layout compute(int cols, int rows, bool miniBufferVisible);
};

// Box with a one-cell border; body lines are clipped and padded to the box
std::string drawBox(const Rect& box, const std::string& title, bool focused,
                    const std::vector<std::string>& body);

// Writes all of data to fd. A full non-blocking fd is polled until writable.
Result<void> writeAll(int fd, const std::string& data);

enum class Notification {
    SessionExited,
};

//=============================================================================
// Commander - full-screen host for the AI and shell panes
//
// Owns the host terminal (raw mode, alternate screen, mouse and paste
// reporting), decodes stdin into events and routes them: global keys first,
// mouse to the pane under the pointer, everything else to the focused pane.
//=============================================================================

class Commander : public base::EventListener {
public:
    using Ptr = std::shared_ptr<Commander>;
    // role is "ai" or "shell"
    using NotifyCallback = std::function<void(Notification, const std::string& role, const std::string& detail)>;
    // Receives everything drawn to the host terminal
    using Output = std::function<void(const std::string&)>;

    enum class Focus { Content, MiniBuffer };

    static Result<Ptr> create(Config::Ptr config, base::EventLoop::Ptr loop,
                              Output output = nullptr) noexcept;

    ~Commander() override = default;

    const char* typeName() const override { return "Commander"; }

    // Take over the terminal and run the loop until quit()
    Result<void> run();
    Result<void> quit();

    // Lay out for a terminal of cols x rows and resize the panes
    Result<void> resize(int cols, int rows);

    // Stdin, SIGWINCH and the ESC flush timer
    Result<bool> onEvent(const base::Event& event) override;

    // One decoded input event: global keys, then routing
    Result<bool> handleInput(const base::Event& event);

    Result<void> launchAi(const std::string& providerName = "");
    Result<void> toggleMiniBuffer();
    void focus(Focus focus);

    Focus focused() const { return _focus; }
    const Layout& layout() const { return _layout; }
    bool isQuitting() const { return _quitting; }
    ProcessPane::Ptr aiPane() const { return _aiPane; }
    ProcessPane::Ptr shellPane() const { return _shellPane; }
    const AiProviderRegistry& providers() const { return _providers; }

    void setNotifyCallback(NotifyCallback callback) { _notify = std::move(callback); }

    // Full-screen frame from the current pane views
    std::string composeScreen();
    void redraw();

protected:
    Result<void> onShutdown() override;

private:
    Commander(Config::Ptr config, base::EventLoop::Ptr loop, Output output);
    Result<void> init();

    Result<ProcessPane::Ptr> createPane(RestartPolicy policy, const std::string& role);
    Result<void> ensureShell();

    Result<void> enterRawMode();
    void restoreTerminal();
    Result<void> readStdin();
    void feedInput(const char* data, size_t len);

    std::string statusBar() const;
    std::string contentTitle() const;

    Config::Ptr _config;
    base::EventLoop::Ptr _loop;
    Output _output;
    Clipboard::Ptr _clipboard;
    AiProviderRegistry _providers;
    InputDecoder _decoder;

    ProcessPane::Ptr _aiPane;
    ProcessPane::Ptr _shellPane;
    std::string _aiProviderName;

    Layout _layout;
    int _cols = 80;
    int _rows = 24;
    Focus _focus = Focus::Content;
    bool _miniBufferVisible = false;
    // Pane that received the last mouse-down; drags and release follow it
    ProcessPane::Ptr _mouseTarget;

    base::PollId _stdinPoll = -1;
    base::TimerId _flushTimer = -1;
    base::SignalId _winchSignal = -1;

    bool _rawMode = false;
    struct termios _savedTermios = {};
    bool _quitting = false;
    std::string _notice;

    NotifyCallback _notify;
};

} // namespace vcmd
