#include <vcmd/base/event-loop.h>
#include <ytrace/ytrace.hpp>
#include <uv.h>
#include <unordered_map>
#include <vector>

namespace vcmd {
namespace base {

struct PollHandle {
    uv_poll_t poll;
    int fd = -1;
    bool initialized = false;
    std::vector<std::weak_ptr<EventListener>> listeners;
};

struct TimerHandle {
    uv_timer_t timer;
    int id = -1;
    Timeout timeout = 0;
    bool repeat = true;
    std::vector<std::weak_ptr<EventListener>> listeners;
};

struct SignalHandle {
    uv_signal_t signal;
    int signum = 0;
    std::weak_ptr<EventListener> listener;
};

struct WorkRequest {
    uv_work_t req;
    EventLoop::Work work;
    EventLoop::Work afterWork;
};

// Handles are owned by the maps until destroy; then ownership moves to the
// close callback, which frees them once libuv is done with the memory.
template<typename H>
static void closeAndFree(std::unique_ptr<H> handle, uv_handle_t* uvHandle) {
    uvHandle->data = handle.release();
    uv_close(uvHandle, [](uv_handle_t* h) {
        delete static_cast<H*>(h->data);
    });
}

class EventLoopImpl : public EventLoop {
public:
    EventLoopImpl() {
        _loop = uv_default_loop();
    }

    ~EventLoopImpl() override = default;

    const char* typeName() const override { return "EventLoop"; }

    int start() override {
        yinfo("EventLoop::start: running uv_default_loop");
        return uv_run(_loop, UV_RUN_DEFAULT);
    }

    Result<void> stop() override {
        yinfo("EventLoop::stop");
        uv_stop(_loop);
        return Ok();
    }

    int runOnce() override {
        return uv_run(_loop, UV_RUN_ONCE);
    }

    //=========================================================================
    // Polls
    //=========================================================================

    Result<PollId> createPoll() override {
        PollId id = _nextPollId++;
        _polls[id] = std::make_unique<PollHandle>();
        return Ok(id);
    }

    Result<void> configPoll(PollId id, int fd) override {
        auto it = _polls.find(id);
        if (it == _polls.end()) {
            return Err("Poll not found");
        }

        auto& ph = it->second;
        ph->fd = fd;
        int r = uv_poll_init(_loop, &ph->poll, fd);
        if (r != 0) {
            yerror("EventLoop::configPoll: uv_poll_init failed for fd={}: {}", fd, uv_strerror(r));
            return Err(std::string("uv_poll_init failed: ") + uv_strerror(r));
        }
        ph->initialized = true;
        ph->poll.data = ph.get();
        ydebug("EventLoop::configPoll: id={} fd={}", id, fd);
        return Ok();
    }

    Result<void> startPoll(PollId id) override {
        auto it = _polls.find(id);
        if (it == _polls.end() || !it->second->initialized) {
            return Err("Poll not found or not configured");
        }

        int r = uv_poll_start(&it->second->poll, UV_READABLE, onPollCallback);
        if (r != 0) {
            yerror("EventLoop::startPoll: uv_poll_start failed for fd={}: {}", it->second->fd, uv_strerror(r));
            return Err(std::string("uv_poll_start failed: ") + uv_strerror(r));
        }
        return Ok();
    }

    Result<void> destroyPoll(PollId id) override {
        auto it = _polls.find(id);
        if (it == _polls.end()) {
            return Err("Poll not found");
        }

        auto handle = std::move(it->second);
        _polls.erase(it);
        if (handle->initialized) {
            uv_poll_stop(&handle->poll);
            auto* uvHandle = reinterpret_cast<uv_handle_t*>(&handle->poll);
            closeAndFree(std::move(handle), uvHandle);
        }
        return Ok();
    }

    Result<void> registerPollListener(PollId id, EventListener::Ptr listener) override {
        auto it = _polls.find(id);
        if (it == _polls.end()) {
            return Err("Poll not found");
        }
        it->second->listeners.push_back(listener);
        return Ok();
    }

    //=========================================================================
    // Timers
    //=========================================================================

    Result<TimerId> createTimer() override {
        TimerId id = _nextTimerId++;
        auto th = std::make_unique<TimerHandle>();
        th->id = id;
        int r = uv_timer_init(_loop, &th->timer);
        if (r != 0) {
            return Err<TimerId>(std::string("uv_timer_init failed: ") + uv_strerror(r));
        }
        th->timer.data = th.get();
        _timers[id] = std::move(th);
        ydebug("EventLoop::createTimer: id={}", id);
        return Ok(id);
    }

    Result<void> configTimer(TimerId id, Timeout timeoutMs, bool repeat) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err("Timer not found");
        }

        auto& th = it->second;
        th->timeout = timeoutMs < 0 ? 0 : timeoutMs;
        th->repeat = repeat;
        if (uv_is_active(reinterpret_cast<uv_handle_t*>(&th->timer))) {
            uv_timer_start(&th->timer, onTimerCallback, th->timeout, th->repeat ? th->timeout : 0);
        }
        return Ok();
    }

    Result<void> startTimer(TimerId id) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err("Timer not found");
        }

        auto& th = it->second;
        int r = uv_timer_start(&th->timer, onTimerCallback, th->timeout, th->repeat ? th->timeout : 0);
        if (r != 0) {
            return Err(std::string("uv_timer_start failed: ") + uv_strerror(r));
        }
        return Ok();
    }

    Result<void> stopTimer(TimerId id) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err("Timer not found");
        }
        uv_timer_stop(&it->second->timer);
        return Ok();
    }

    Result<void> destroyTimer(TimerId id) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err("Timer not found");
        }

        auto handle = std::move(it->second);
        _timers.erase(it);
        uv_timer_stop(&handle->timer);
        auto* uvHandle = reinterpret_cast<uv_handle_t*>(&handle->timer);
        closeAndFree(std::move(handle), uvHandle);
        return Ok();
    }

    Result<void> registerTimerListener(TimerId id, EventListener::Ptr listener) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err("Timer not found");
        }
        it->second->listeners.push_back(listener);
        return Ok();
    }

    //=========================================================================
    // Signals
    //=========================================================================

    Result<SignalId> watchSignal(int signum, EventListener::Ptr listener) override {
        auto sh = std::make_unique<SignalHandle>();
        sh->signum = signum;
        sh->listener = listener;
        int r = uv_signal_init(_loop, &sh->signal);
        if (r != 0) {
            return Err<SignalId>(std::string("uv_signal_init failed: ") + uv_strerror(r));
        }
        sh->signal.data = sh.get();
        r = uv_signal_start(&sh->signal, onSignalCallback, signum);
        if (r != 0) {
            auto* uvHandle = reinterpret_cast<uv_handle_t*>(&sh->signal);
            closeAndFree(std::move(sh), uvHandle);
            return Err<SignalId>(std::string("uv_signal_start failed: ") + uv_strerror(r));
        }
        SignalId id = _nextSignalId++;
        _signals[id] = std::move(sh);
        ydebug("EventLoop::watchSignal: id={} signum={}", id, signum);
        return Ok(id);
    }

    Result<void> unwatchSignal(SignalId id) override {
        auto it = _signals.find(id);
        if (it == _signals.end()) {
            return Err("Signal watch not found");
        }
        auto handle = std::move(it->second);
        _signals.erase(it);
        uv_signal_stop(&handle->signal);
        auto* uvHandle = reinterpret_cast<uv_handle_t*>(&handle->signal);
        closeAndFree(std::move(handle), uvHandle);
        return Ok();
    }

    //=========================================================================
    // Thread pool work
    //=========================================================================

    Result<void> queueWork(Work work, Work afterWork) override {
        auto* req = new WorkRequest();
        req->work = std::move(work);
        req->afterWork = std::move(afterWork);
        req->req.data = req;
        int r = uv_queue_work(_loop, &req->req, onWork, onAfterWork);
        if (r != 0) {
            delete req;
            return Err(std::string("uv_queue_work failed: ") + uv_strerror(r));
        }
        return Ok();
    }

private:
    static void dispatchTo(const std::vector<std::weak_ptr<EventListener>>& listeners, const Event& event) {
        auto copy = listeners;
        for (const auto& wp : copy) {
            if (auto sp = wp.lock()) {
                if (auto res = sp->onEvent(event); !res) {
                    yerror("EventLoop: listener failed: {}", error_msg(res));
                }
            }
        }
    }

    static void onPollCallback(uv_poll_t* handle, int status, int events) {
        auto* ph = static_cast<PollHandle*>(handle->data);
        if (status < 0) {
            ywarn("EventLoop::onPollCallback: error status={} for fd={}", status, ph->fd);
            return;
        }
        if (events & UV_READABLE) {
            dispatchTo(ph->listeners, Event::pollReadable(ph->fd));
        }
    }

    static void onTimerCallback(uv_timer_t* handle) {
        auto* th = static_cast<TimerHandle*>(handle->data);
        dispatchTo(th->listeners, Event::timerEvent(th->id));
    }

    static void onSignalCallback(uv_signal_t* handle, int signum) {
        auto* sh = static_cast<SignalHandle*>(handle->data);
        if (auto sp = sh->listener.lock()) {
            if (auto res = sp->onEvent(Event::signalEvent(signum)); !res) {
                yerror("EventLoop: signal listener failed: {}", error_msg(res));
            }
        }
    }

    static void onWork(uv_work_t* req) {
        auto* wr = static_cast<WorkRequest*>(req->data);
        if (wr->work) wr->work();
    }

    static void onAfterWork(uv_work_t* req, int status) {
        std::unique_ptr<WorkRequest> wr(static_cast<WorkRequest*>(req->data));
        if (status == UV_ECANCELED) {
            ydebug("EventLoop::onAfterWork: work cancelled");
        }
        if (wr->afterWork) wr->afterWork();
    }

    uv_loop_t* _loop = nullptr;
    std::unordered_map<PollId, std::unique_ptr<PollHandle>> _polls;
    std::unordered_map<TimerId, std::unique_ptr<TimerHandle>> _timers;
    std::unordered_map<SignalId, std::unique_ptr<SignalHandle>> _signals;
    PollId _nextPollId = 1;
    TimerId _nextTimerId = 1;
    SignalId _nextSignalId = 1;
};

Result<EventLoop::Ptr> EventLoop::instance() noexcept {
    thread_local Ptr loop;
    if (!loop) {
        loop = Ptr(new EventLoopImpl());
    }
    return Ok(loop);
}

} // namespace base
} // namespace vcmd
