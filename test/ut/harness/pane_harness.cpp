#include "pane_harness.h"

namespace vcmd::test {

//-----------------------------------------------------------------------------
// ManualTickSource
//-----------------------------------------------------------------------------

Result<void> ManualTickSource::schedule(std::chrono::milliseconds delay, Callback callback) {
    _callback = std::move(callback);
    _lastDelay = delay;
    _scheduled++;
    return Ok();
}

void ManualTickSource::cancel() {
    _callback = nullptr;
}

bool ManualTickSource::fire() {
    if (!_callback) return false;
    auto callback = std::move(_callback);
    _callback = nullptr;
    callback();
    return true;
}

//-----------------------------------------------------------------------------
// FakeSession
//-----------------------------------------------------------------------------

Result<void> FakeSession::start(const SpawnConfig& config) {
    if (!failStart.empty()) {
        return Err(failStart);
    }
    spawned = config;
    _running = true;
    _exitError.clear();
    return Ok();
}

Result<void> FakeSession::write(const std::string& data) {
    if (_running) {
        written += data;
    }
    return Ok();
}

Result<void> FakeSession::resize(int cols, int rows) {
    resizes++;
    return _screen->resize(cols, rows);
}

Result<void> FakeSession::stop() {
    if (!_running) return Ok();
    exit("signal: killed");
    return Ok();
}

Result<void> FakeSession::requestRead(ReadCallback callback) {
    if (!_running) {
        return Err("session not running");
    }
    if (_callback) {
        return Err("read already in flight");
    }
    _callback = std::move(callback);
    return Ok();
}

bool FakeSession::emit(const std::string& data) {
    if (!_callback) return false;
    auto callback = std::move(_callback);
    _callback = nullptr;
    callback(ReadResult::output(data));
    return true;
}

bool FakeSession::exit(const std::string& exitError) {
    _running = false;
    _exitError = exitError;
    if (!_callback) return false;
    auto callback = std::move(_callback);
    _callback = nullptr;
    callback(ReadResult::exited(exitError));
    return true;
}

//-----------------------------------------------------------------------------
// PaneHarness
//-----------------------------------------------------------------------------

PaneHarness::PaneHarness(RestartPolicy policy, int width, int height)
    : _ticks(std::make_shared<ManualTickSource>())
    , _clipboard(std::make_shared<RecordingClipboard>()) {
    ProcessPaneConfig config;
    config.name = "test";
    config.policy = policy;
    config.spawn.command = "/bin/sh";

    auto factory = [this](VirtualScreen::Ptr screen) -> Result<ProcessSession::Ptr> {
        auto session = std::make_shared<FakeSession>(std::move(screen));
        session->failStart = failNextStart;
        failNextStart.clear();
        sessions.push_back(session);
        return Ok(ProcessSession::Ptr(session));
    };

    auto res = ProcessPane::create(config, factory, _ticks, _clipboard);
    if (res) {
        _pane = *res;
        (void)_pane->resize(width, height);
    }
}

std::string PaneHarness::frame() {
    _pane->renderer().renderNow();
    return _pane->view();
}

void PaneHarness::emitLines(int count, const std::string& prefix) {
    for (int i = 0; i < count; ++i) {
        session().emit(prefix + " " + std::to_string(i) + "\r\n");
    }
}

} // namespace vcmd::test
