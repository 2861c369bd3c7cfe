#pragma once

#include "event.h"
#include "event-listener.h"
#include <chrono>
#include <functional>

namespace vcmd {
namespace base {

using PollId = int;
using TimerId = int;
using SignalId = int;
using Timeout = int;

// Single-threaded cooperative loop over libuv. Every listener and every
// work completion runs on the thread that owns the loop; only the body of
// queueWork() runs on a pool thread.
class EventLoop : public virtual Object {
public:
    using Ptr = std::shared_ptr<EventLoop>;
    using Work = std::function<void()>;

    // One loop per thread, created on first use.
    static Result<Ptr> instance() noexcept;

    virtual ~EventLoop() = default;

    // Run until stop() or until there is nothing left to do (blocking)
    virtual int start() = 0;
    virtual Result<void> stop() = 0;

    // Run a single blocking iteration; non-zero while handles or requests remain
    virtual int runOnce() = 0;

    // Poll (file descriptor) management
    virtual Result<PollId> createPoll() = 0;
    virtual Result<void> configPoll(PollId id, int fd) = 0;
    virtual Result<void> startPoll(PollId id) = 0;
    virtual Result<void> destroyPoll(PollId id) = 0;
    virtual Result<void> registerPollListener(PollId id, EventListener::Ptr listener) = 0;

    // Timer management. A timer configured with repeat=false fires once per startTimer().
    virtual Result<TimerId> createTimer() = 0;
    virtual Result<void> configTimer(TimerId id, Timeout timeoutMs, bool repeat = true) = 0;
    virtual Result<void> startTimer(TimerId id) = 0;
    virtual Result<void> stopTimer(TimerId id) = 0;
    virtual Result<void> destroyTimer(TimerId id) = 0;
    virtual Result<void> registerTimerListener(TimerId id, EventListener::Ptr listener) = 0;

    // POSIX signal delivered as Event::Type::Signal on the loop thread
    virtual Result<SignalId> watchSignal(int signum, EventListener::Ptr listener) = 0;
    virtual Result<void> unwatchSignal(SignalId id) = 0;

    // Run work on the libuv thread pool, then afterWork on the loop thread.
    virtual Result<void> queueWork(Work work, Work afterWork) = 0;

protected:
    EventLoop() = default;
};

} // namespace base
} // namespace vcmd
