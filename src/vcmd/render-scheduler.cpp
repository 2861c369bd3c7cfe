#include <vcmd/render-scheduler.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace vcmd {

//=============================================================================
// LoopTickSource
//=============================================================================

class LoopTickSource : public TickSource, public base::EventListener {
public:
    explicit LoopTickSource(base::EventLoop::Ptr loop) : _loop(std::move(loop)) {}

    ~LoopTickSource() override {
        if (_timerId >= 0) {
            if (auto res = _loop->destroyTimer(_timerId); !res) {
                ywarn("LoopTickSource: destroyTimer failed: {}", error_msg(res));
            }
        }
    }

    const char* typeName() const override { return "LoopTickSource"; }

    Result<void> init() {
        auto timerRes = _loop->createTimer();
        if (!timerRes) {
            return Err("Failed to create render timer", timerRes);
        }
        _timerId = *timerRes;
        return Ok();
    }

    // Listener registration needs shared_from_this, so it happens after construction
    Result<void> attach() {
        return _loop->registerTimerListener(_timerId, sharedAs<base::EventListener>());
    }

    Result<void> schedule(std::chrono::milliseconds delay, Callback callback) override {
        _callback = std::move(callback);
        if (auto res = _loop->configTimer(_timerId, static_cast<base::Timeout>(delay.count()), false); !res) {
            return res;
        }
        return _loop->startTimer(_timerId);
    }

    void cancel() override {
        _callback = nullptr;
        if (auto res = _loop->stopTimer(_timerId); !res) {
            ywarn("LoopTickSource: stopTimer failed: {}", error_msg(res));
        }
    }

    Clock::time_point now() const override { return Clock::now(); }

    Result<bool> onEvent(const base::Event& event) override {
        if (event.type != base::Event::Type::Timer || event.timer.timerId != _timerId) {
            return Ok(false);
        }
        auto callback = std::move(_callback);
        _callback = nullptr;
        if (callback) callback();
        return Ok(true);
    }

private:
    base::EventLoop::Ptr _loop;
    base::TimerId _timerId = -1;
    Callback _callback;
};

Result<TickSource::Ptr> TickSource::create(base::EventLoop::Ptr loop) noexcept {
    if (!loop) {
        return Err<Ptr>("TickSource::create: null event loop");
    }
    auto source = std::make_shared<LoopTickSource>(std::move(loop));
    if (auto res = source->init(); !res) {
        return Err<Ptr>("Failed to init tick source", res);
    }
    if (auto res = source->attach(); !res) {
        return Err<Ptr>("Failed to attach tick source", res);
    }
    return Ok<Ptr>(source);
}

//=============================================================================
// RenderScheduler
//=============================================================================

RenderScheduler::RenderScheduler(TickSource::Ptr ticks, Composer composer, KeepTicking keepTicking,
                                 RenderSchedulerConfig config)
    : _ticks(std::move(ticks))
    , _composer(std::move(composer))
    , _keepTicking(std::move(keepTicking))
    , _config(config) {}

RenderScheduler::~RenderScheduler() {
    *_alive = false;
    if (_tickScheduled && _ticks) {
        _ticks->cancel();
    }
}

std::chrono::milliseconds RenderScheduler::nextDelay() const {
    using namespace std::chrono;
    auto elapsed = duration_cast<milliseconds>(_ticks->now() - _lastRender);
    auto delay = _config.interval - elapsed;
    return std::clamp(delay, _config.minInterval, std::max(_config.interval, _config.minInterval));
}

void RenderScheduler::markDirty() {
    _dirty = true;
    if (!_tickScheduled) {
        scheduleTick();
    }
}

void RenderScheduler::scheduleTick() {
    std::weak_ptr<bool> alive = _alive;
    auto res = _ticks->schedule(nextDelay(), [this, alive]() {
        if (auto a = alive.lock(); a && *a) {
            onTick();
        }
    });
    if (!res) {
        yerror("RenderScheduler: failed to schedule tick: {}", error_msg(res));
        return;
    }
    _tickScheduled = true;
}

void RenderScheduler::onTick() {
    _tickScheduled = false;
    _stats.ticks++;

    const bool wasDirty = _dirty;
    if (wasDirty) {
        render();
    }
    if (wasDirty && _keepTicking && _keepTicking()) {
        scheduleTick();
    }
}

void RenderScheduler::render() {
    std::string next = _composer ? _composer() : std::string();
    _stats.renders++;
    _dirty = false;
    _lastRender = _ticks->now();

    bool replaced = false;
    if (!_hasFrame || next != _cache) {
        _cache = std::move(next);
        _hasFrame = true;
        _stats.replacements++;
        replaced = true;
    }
    if (_frameHook) {
        _frameHook(_cache, replaced);
    }
}

void RenderScheduler::renderNow() {
    render();
}

const std::string& RenderScheduler::frame() {
    if (!_hasFrame) {
        render();
    }
    return _cache;
}

} // namespace vcmd
