//=============================================================================
// Render Scheduler Tests
//
// Covers: coalesced ticks, frame stability, tick-driven rescheduling,
// interval throttling
//=============================================================================

#include <boost/ut.hpp>
#include "harness/pane_harness.h"

using namespace boost::ut;
using namespace vcmd;
using namespace vcmd::test;
using namespace std::chrono_literals;

suite render_scheduler_tests = [] {
    "markDirty schedules a single tick"_test = [] {
        auto ticks = std::make_shared<ManualTickSource>();
        RenderScheduler scheduler(ticks, [] { return std::string("frame"); }, [] { return false; });

        scheduler.markDirty();
        scheduler.markDirty();
        scheduler.markDirty();
        expect(ticks->scheduled() == 1_i);
        expect(scheduler.isTickScheduled());

        expect(ticks->fire());
        expect(scheduler.stats().renders == 1_u);
        expect(!scheduler.isDirty());
        expect(scheduler.frame() == "frame");
    };

    "unchanged content keeps the cached frame"_test = [] {
        auto ticks = std::make_shared<ManualTickSource>();
        int hookCalls = 0;
        int replacedCalls = 0;
        RenderScheduler scheduler(ticks, [] { return std::string("same"); }, [] { return false; });
        scheduler.setFrameHook([&](const std::string&, bool replaced) {
            hookCalls++;
            if (replaced) replacedCalls++;
        });

        for (int i = 0; i < 3; ++i) {
            scheduler.markDirty();
            ticks->fire();
        }
        expect(scheduler.stats().renders == 3_u);
        expect(scheduler.stats().replacements == 1_u);
        expect(hookCalls == 3_i);
        expect(replacedCalls == 1_i);
    };

    "changed content replaces the frame"_test = [] {
        auto ticks = std::make_shared<ManualTickSource>();
        std::string content = "a";
        RenderScheduler scheduler(ticks, [&] { return content; }, [] { return false; });

        scheduler.markDirty();
        ticks->fire();
        content = "b";
        scheduler.markDirty();
        ticks->fire();
        expect(scheduler.frame() == "b");
        expect(scheduler.stats().replacements == 2_u);
    };

    "rendering tick reschedules while the process runs"_test = [] {
        auto ticks = std::make_shared<ManualTickSource>();
        bool running = true;
        RenderScheduler scheduler(ticks, [] { return std::string("x"); }, [&] { return running; });

        scheduler.markDirty();
        ticks->fire();
        expect(ticks->pending()) << "a rendering tick schedules the next one";

        ticks->fire();
        expect(!ticks->pending()) << "an idle tick goes quiet";
        expect(scheduler.stats().ticks == 2_u);
        expect(scheduler.stats().renders == 1_u);
    };

    "no rescheduling once the process stopped"_test = [] {
        auto ticks = std::make_shared<ManualTickSource>();
        RenderScheduler scheduler(ticks, [] { return std::string("x"); }, [] { return false; });
        scheduler.markDirty();
        ticks->fire();
        expect(!ticks->pending());
    };

    "delay is measured from the last render"_test = [] {
        auto ticks = std::make_shared<ManualTickSource>();
        RenderSchedulerConfig config;
        config.interval = 50ms;
        RenderScheduler scheduler(ticks, [] { return std::string("x"); }, [] { return false; }, config);

        scheduler.markDirty();
        expect(ticks->lastDelay() == 0ms) << "first frame is not delayed";
        ticks->fire();

        ticks->advance(20ms);
        scheduler.markDirty();
        expect(ticks->lastDelay() == 30ms);
        ticks->fire();

        ticks->advance(200ms);
        scheduler.markDirty();
        expect(ticks->lastDelay() == 0ms);
    };

    "minimum interval bounds the delay"_test = [] {
        auto ticks = std::make_shared<ManualTickSource>();
        RenderSchedulerConfig config;
        config.interval = 50ms;
        config.minInterval = 10ms;
        RenderScheduler scheduler(ticks, [] { return std::string("x"); }, [] { return false; }, config);
        scheduler.markDirty();
        expect(ticks->lastDelay() == 10ms);
    };

    "renderNow bypasses the throttle"_test = [] {
        auto ticks = std::make_shared<ManualTickSource>();
        std::string content = "before";
        RenderScheduler scheduler(ticks, [&] { return content; }, [] { return false; });
        expect(scheduler.frame() == "before");
        content = "after";
        scheduler.renderNow();
        expect(scheduler.frame() == "after");
        expect(ticks->scheduled() == 0_i);
    };

    "destroyed scheduler ignores a late tick"_test = [] {
        auto ticks = std::make_shared<ManualTickSource>();
        int renders = 0;
        {
            RenderScheduler scheduler(ticks, [&] { renders++; return std::string("x"); }, [] { return true; });
            scheduler.markDirty();
        }
        ticks->fire();
        expect(renders == 0_i);
    };
};
