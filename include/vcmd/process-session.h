#pragma once

#include <vcmd/base/event-loop.h>
#include <vcmd/base/object.h>
#include <vcmd/result.hpp>
#include <vcmd/virtual-screen.h>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace vcmd {

struct SpawnConfig {
    std::string command;
    std::vector<std::string> args;
    // Added to the inherited environment
    std::vector<std::pair<std::string, std::string>> env;
    // Empty: inherit the host's working directory
    std::string workingDir;
    // 0: take the screen size, or 80x24
    int cols = 0;
    int rows = 0;
};

struct ReadResult {
    enum class Kind { Output, Exited };

    Kind kind = Kind::Output;
    std::string data;       // Output
    std::string exitError;  // Exited: "" for a clean exit

    static ReadResult output(std::string data) { return {Kind::Output, std::move(data), {}}; }
    static ReadResult exited(std::string error) { return {Kind::Exited, {}, std::move(error)}; }
};

//=============================================================================
// ProcessSession - a child process behind a pseudo-terminal
//
// All methods are called on the loop thread. Reads happen off-loop, one at a
// time: requestRead() completes exactly once, on the loop thread, with either
// a chunk of output or the final exit message.
//=============================================================================

class ProcessSession : public virtual base::Object {
public:
    using Ptr = std::shared_ptr<ProcessSession>;
    using ReadCallback = std::function<void(ReadResult)>;

    static constexpr size_t READ_BUFFER_SIZE = 65536;

    // forkpty backed session; screen is resized along with the pty
    static Result<Ptr> create(base::EventLoop::Ptr loop, VirtualScreen::Ptr screen) noexcept;

    virtual ~ProcessSession() = default;

    virtual Result<void> start(const SpawnConfig& config) = 0;

    // Dropped without error while not running
    virtual Result<void> write(const std::string& data) = 0;

    virtual Result<void> resize(int cols, int rows) = 0;

    // Kill the process group; an in-flight read completes with Exited
    virtual Result<void> stop() = 0;

    virtual Result<void> requestRead(ReadCallback callback) = 0;

    virtual bool isRunning() const = 0;
    virtual bool isReading() const = 0;
    virtual std::string exitError() const = 0;

protected:
    ProcessSession() = default;
};

// Absolute path of an executable found on PATH (names with '/' are checked
// as given); "" if there is none
std::string findExecutable(const std::string& name);

// "exit status 3", "signal: killed", "" for exit status 0
std::string describeWaitStatus(int status);

} // namespace vcmd
