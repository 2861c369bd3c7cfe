#pragma once

#include <vcmd/base/event-loop.h>
#include <vcmd/result.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace vcmd {

//=============================================================================
// TickSource - delayed single-shot callbacks plus a clock
//=============================================================================

class TickSource {
public:
    using Ptr = std::shared_ptr<TickSource>;
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;

    // Backed by a one-shot EventLoop timer
    static Result<Ptr> create(base::EventLoop::Ptr loop) noexcept;

    virtual ~TickSource() = default;

    // Replaces any pending callback
    virtual Result<void> schedule(std::chrono::milliseconds delay, Callback callback) = 0;
    virtual void cancel() = 0;
    virtual Clock::time_point now() const = 0;
};

struct RenderSchedulerConfig {
    std::chrono::milliseconds interval{50};
    std::chrono::milliseconds minInterval{0};
};

//=============================================================================
// RenderScheduler - throttled, change-detecting frame cache
//
// idle --markDirty--> tick-scheduled --tick--> idle (+ render if dirty)
// A tick that rendered reschedules itself while keepTicking() holds, so a
// continuous output stream is redrawn at most once per interval.
//=============================================================================

class RenderScheduler {
public:
    using Composer = std::function<std::string()>;
    using KeepTicking = std::function<bool()>;
    using FrameHook = std::function<void(const std::string& frame, bool replaced)>;

    struct Stats {
        uint64_t ticks = 0;
        uint64_t renders = 0;        // frames computed
        uint64_t replacements = 0;   // frames that differed from the cache
    };

    RenderScheduler(TickSource::Ptr ticks, Composer composer, KeepTicking keepTicking,
                    RenderSchedulerConfig config = {});
    ~RenderScheduler();

    RenderScheduler(const RenderScheduler&) = delete;
    RenderScheduler& operator=(const RenderScheduler&) = delete;

    // Content changed; a tick is scheduled unless one is pending
    void markDirty();

    // Compute the frame now (selection feedback, resize)
    void renderNow();

    // Cached frame; computed on the spot if nothing is cached yet
    const std::string& frame();

    bool isDirty() const { return _dirty; }
    bool isTickScheduled() const { return _tickScheduled; }
    const Stats& stats() const { return _stats; }

    void setFrameHook(FrameHook hook) { _frameHook = std::move(hook); }

    // Delay for the next tick measured from the last render
    std::chrono::milliseconds nextDelay() const;

    void onTick();

private:
    void scheduleTick();
    void render();

    TickSource::Ptr _ticks;
    Composer _composer;
    KeepTicking _keepTicking;
    RenderSchedulerConfig _config;
    FrameHook _frameHook;

    std::string _cache;
    bool _hasFrame = false;
    bool _dirty = false;
    bool _tickScheduled = false;
    TickSource::Clock::time_point _lastRender{};
    Stats _stats;

    std::shared_ptr<bool> _alive = std::make_shared<bool>(true);
};

} // namespace vcmd
