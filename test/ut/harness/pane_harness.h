#pragma once

//=============================================================================
// Pane Test Harness
//
// Drives a ProcessPane without a pty or an event loop: a scripted session
// stands in for the child process and ticks fire only when asked.
//=============================================================================

#include <vcmd/clipboard.h>
#include <vcmd/process-pane.h>
#include <vcmd/process-session.h>
#include <vcmd/render-scheduler.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace vcmd::test {

//-----------------------------------------------------------------------------
// ManualTickSource - clock and callbacks under test control
//-----------------------------------------------------------------------------
class ManualTickSource : public TickSource {
public:
    Result<void> schedule(std::chrono::milliseconds delay, Callback callback) override;
    void cancel() override;
    Clock::time_point now() const override { return _now; }

    void advance(std::chrono::milliseconds ms) { _now += ms; }

    // Run the pending callback, if any; returns false when nothing was scheduled
    bool fire();

    bool pending() const { return static_cast<bool>(_callback); }
    std::chrono::milliseconds lastDelay() const { return _lastDelay; }
    int scheduled() const { return _scheduled; }

private:
    Clock::time_point _now = Clock::time_point{} + std::chrono::hours(1);
    Callback _callback;
    std::chrono::milliseconds _lastDelay{0};
    int _scheduled = 0;
};

//-----------------------------------------------------------------------------
// FakeSession - scripted child process
//-----------------------------------------------------------------------------
class FakeSession : public ProcessSession {
public:
    explicit FakeSession(VirtualScreen::Ptr screen) : _screen(std::move(screen)) {}

    const char* typeName() const override { return "FakeSession"; }

    Result<void> start(const SpawnConfig& config) override;
    Result<void> write(const std::string& data) override;
    Result<void> resize(int cols, int rows) override;
    Result<void> stop() override;
    Result<void> requestRead(ReadCallback callback) override;

    bool isRunning() const override { return _running; }
    bool isReading() const override { return static_cast<bool>(_callback); }
    std::string exitError() const override { return _exitError; }

    // Complete the pending read with output / with the exit
    bool emit(const std::string& data);
    bool exit(const std::string& exitError);

    std::string failStart;          // non-empty: start() fails with this message
    std::string written;
    SpawnConfig spawned;
    int resizes = 0;

private:
    VirtualScreen::Ptr _screen;
    ReadCallback _callback;
    bool _running = false;
    std::string _exitError;
};

//-----------------------------------------------------------------------------
// RecordingClipboard
//-----------------------------------------------------------------------------
class RecordingClipboard : public Clipboard {
public:
    Result<void> copy(const std::string& text) override {
        copied.push_back(text);
        if (!copyError.empty()) {
            return Err(copyError);
        }
        return Ok();
    }

    Result<void> requestPaste(PasteCallback callback) override {
        if (holdPaste) {
            pending = std::move(callback);
            return Ok();
        }
        callback(Ok(std::string(pasteText)));
        return Ok();
    }

    // Delivers a held paste
    void completePaste() {
        if (!pending) return;
        auto callback = std::move(pending);
        pending = nullptr;
        callback(Ok(std::string(pasteText)));
    }

    std::vector<std::string> copied;
    std::string pasteText;
    // Non-empty: copy() records the text, then fails with this message
    std::string copyError;
    // Keep the paste callback until completePaste()
    bool holdPaste = false;
    PasteCallback pending;
};

//-----------------------------------------------------------------------------
// PaneHarness - a pane wired to fakes, sized width x height
//-----------------------------------------------------------------------------
class PaneHarness {
public:
    explicit PaneHarness(RestartPolicy policy = RestartPolicy::shell(), int width = 40, int height = 10);

    PaneHarness(const PaneHarness&) = delete;
    PaneHarness& operator=(const PaneHarness&) = delete;

    ProcessPane& pane() { return *_pane; }
    ProcessPane::Ptr panePtr() { return _pane; }
    FakeSession& session() { return *sessions.back(); }
    ManualTickSource& ticks() { return *_ticks; }
    RecordingClipboard& clipboard() { return *_clipboard; }

    // Fresh frame regardless of throttling
    std::string frame();

    // Emit lines one chunk each, "<prefix> <i>\r\n"
    void emitLines(int count, const std::string& prefix = "line");

    std::vector<std::shared_ptr<FakeSession>> sessions;
    // Message for the next session's start() failure
    std::string failNextStart;

private:
    std::shared_ptr<ManualTickSource> _ticks;
    std::shared_ptr<RecordingClipboard> _clipboard;
    ProcessPane::Ptr _pane;
};

} // namespace vcmd::test
