#include <vcmd/clipboard.h>
#include <vcmd/process-session.h>
#include <ytrace/ytrace.hpp>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <optional>
#include <pthread.h>
#include <sys/wait.h>

namespace vcmd {

static const char BASE64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64Encode(std::string_view data) {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    auto byteAt = [&](size_t i) { return static_cast<uint32_t>(static_cast<unsigned char>(data[i])); };

    size_t i = 0;
    const size_t len = data.size();
    for (; i + 2 < len; i += 3) {
        uint32_t triple = (byteAt(i) << 16) | (byteAt(i + 1) << 8) | byteAt(i + 2);
        result.push_back(BASE64_CHARS[(triple >> 18) & 0x3F]);
        result.push_back(BASE64_CHARS[(triple >> 12) & 0x3F]);
        result.push_back(BASE64_CHARS[(triple >> 6) & 0x3F]);
        result.push_back(BASE64_CHARS[triple & 0x3F]);
    }

    if (i + 1 == len) {
        uint32_t val = byteAt(i) << 16;
        result.push_back(BASE64_CHARS[(val >> 18) & 0x3F]);
        result.push_back(BASE64_CHARS[(val >> 12) & 0x3F]);
        result += "==";
    } else if (i + 2 == len) {
        uint32_t val = (byteAt(i) << 16) | (byteAt(i + 1) << 8);
        result.push_back(BASE64_CHARS[(val >> 18) & 0x3F]);
        result.push_back(BASE64_CHARS[(val >> 12) & 0x3F]);
        result.push_back(BASE64_CHARS[(val >> 6) & 0x3F]);
        result.push_back('=');
    }
    return result;
}

std::string osc52Sequence(const std::string& text) {
    return "\x1b]52;c;" + base64Encode(text) + "\a";
}

namespace {

struct ClipboardTool {
    std::string copyCmd;
    std::string pasteCmd;
};

bool onPath(const std::string& name) {
    return !findExecutable(name).empty();
}

ClipboardTool detectTool() {
    if (std::getenv("WAYLAND_DISPLAY") && onPath("wl-copy")) {
        return {"wl-copy", "wl-paste --no-newline"};
    }
    if (std::getenv("DISPLAY")) {
        if (onPath("xclip")) return {"xclip -selection clipboard -in", "xclip -selection clipboard -out"};
        if (onPath("xsel")) return {"xsel --clipboard --input", "xsel --clipboard --output"};
    }
    if (onPath("pbcopy")) {
        return {"pbcopy", "pbpaste"};
    }
    return {};
}

// Blocks SIGPIPE on the calling thread while a tool's stdin is written. A
// SIGPIPE raised meanwhile is consumed so the failed write only shows up
// as EPIPE.
class SigpipeGuard {
public:
    SigpipeGuard() {
        sigemptyset(&_set);
        sigaddset(&_set, SIGPIPE);
        sigset_t pending;
        sigemptyset(&pending);
        _wasPending = ::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE);
        _blocked = ::pthread_sigmask(SIG_BLOCK, &_set, &_saved) == 0;
    }

    ~SigpipeGuard() {
        if (!_blocked) return;
        sigset_t pending;
        sigemptyset(&pending);
        if (!_wasPending && ::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE)) {
            struct timespec zero = {0, 0};
            while (::sigtimedwait(&_set, nullptr, &zero) == SIGPIPE) {}
        }
        ::pthread_sigmask(SIG_SETMASK, &_saved, nullptr);
    }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

private:
    sigset_t _set;
    sigset_t _saved;
    bool _wasPending = false;
    bool _blocked = false;
};

Result<std::string> runPasteTool(const std::string& cmd) {
    FILE* pipe = ::popen((cmd + " 2>/dev/null").c_str(), "r");
    if (!pipe) {
        return Err<std::string>("failed to run " + cmd);
    }
    std::string output;
    char buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
        output.append(buf, n);
    }
    int status = ::pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return Err<std::string>(cmd + " failed");
    }
    return Ok(std::move(output));
}

struct PasteJob {
    std::string cmd;
    std::optional<Result<std::string>> result;
};

} // namespace

class SystemClipboard : public Clipboard {
public:
    SystemClipboard(ClipboardTool tool, TerminalWriter terminalWriter, base::EventLoop::Ptr loop)
        : _tool(std::move(tool)), _terminalWriter(std::move(terminalWriter)), _loop(std::move(loop)) {}

    Result<void> copy(const std::string& text) override {
        if (!_tool.copyCmd.empty()) {
            FILE* pipe = ::popen((_tool.copyCmd + " 2>/dev/null").c_str(), "w");
            if (pipe) {
                size_t written = 0;
                int status = -1;
                {
                    SigpipeGuard guard;
                    written = std::fwrite(text.data(), 1, text.size(), pipe);
                    if (std::fflush(pipe) != 0) {
                        written = 0;
                    }
                    status = ::pclose(pipe);
                }
                if (written == text.size() && status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0) {
                    ydebug("Clipboard::copy: {} bytes via {}", text.size(), _tool.copyCmd);
                    return Ok();
                }
                ywarn("Clipboard::copy: '{}' failed, status={}", _tool.copyCmd, status);
            }
        }
        if (_terminalWriter) {
            _terminalWriter(osc52Sequence(text));
            ydebug("Clipboard::copy: {} bytes via OSC 52", text.size());
            return Ok();
        }
        return Err("no clipboard tool available");
    }

    Result<void> requestPaste(PasteCallback callback) override {
        if (!callback) {
            return Err("requestPaste: no callback");
        }
        if (_tool.pasteCmd.empty()) {
            callback(Err<std::string>("no clipboard tool available"));
            return Ok();
        }
        if (!_loop) {
            callback(runPasteTool(_tool.pasteCmd));
            return Ok();
        }

        auto job = std::make_shared<PasteJob>();
        job->cmd = _tool.pasteCmd;
        auto res = _loop->queueWork(
            [job]() { job->result = runPasteTool(job->cmd); },
            [job, callback = std::move(callback)]() {
                if (job->result) {
                    callback(std::move(*job->result));
                } else {
                    callback(Err<std::string>(job->cmd + " did not run"));
                }
            });
        if (!res) {
            return Err("Failed to queue clipboard paste", res);
        }
        return Ok();
    }

private:
    ClipboardTool _tool;
    TerminalWriter _terminalWriter;
    base::EventLoop::Ptr _loop;
};

Result<Clipboard::Ptr> Clipboard::create(TerminalWriter terminalWriter, base::EventLoop::Ptr loop) noexcept {
    auto tool = detectTool();
    if (tool.copyCmd.empty()) {
        yinfo("Clipboard: no clipboard tool found, copy uses OSC 52");
    } else {
        yinfo("Clipboard: using '{}'", tool.copyCmd);
    }
    return Ok<Ptr>(std::make_shared<SystemClipboard>(std::move(tool), std::move(terminalWriter), std::move(loop)));
}

} // namespace vcmd
