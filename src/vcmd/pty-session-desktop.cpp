#include <vcmd/process-session.h>
#include <ytrace/ytrace.hpp>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <unistd.h>

#if __has_include(<pty.h>)
#include <pty.h>
#elif __has_include(<util.h>)
#include <util.h>
#endif

namespace vcmd {

std::string describeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        return code == 0 ? std::string() : "exit status " + std::to_string(code);
    }
    if (WIFSIGNALED(status)) {
        std::string name = strsignal(WTERMSIG(status));
        if (!name.empty()) {
            name[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(name[0])));
        }
        return "signal: " + name;
    }
    return "unknown wait status " + std::to_string(status);
}

std::string findExecutable(const std::string& name) {
    if (name.empty()) return {};
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0 ? name : std::string();
    }
    const char* path = std::getenv("PATH");
    if (!path) return {};
    std::string paths = path;
    size_t start = 0;
    while (start <= paths.size()) {
        size_t end = paths.find(':', start);
        if (end == std::string::npos) end = paths.size();
        std::string dir = paths.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0) return candidate;
        start = end + 1;
    }
    return {};
}

namespace {

// Outcome of one off-loop read
struct ReadJob {
    int fd = -1;
    int wakeFd = -1;
    pid_t pid = -1;
    ssize_t n = 0;
    int err = 0;
    bool woken = false;
    bool reaped = false;
    int waitStatus = 0;
    std::string data;
};

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

class PtySession : public ProcessSession {
public:
    PtySession(base::EventLoop::Ptr loop, VirtualScreen::Ptr screen)
        : _loop(std::move(loop)), _screen(std::move(screen)) {}

    ~PtySession() override {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_running && _pid > 0) {
            ::kill(-_pid, SIGKILL);
            ::kill(_pid, SIGKILL);
            if (!_reading) {
                int status = 0;
                ::waitpid(_pid, &status, 0);
            }
        }
        // An in-flight read holds its own reference, so _reading is false here
        closeFd(_masterFd);
        closeFd(_wakeRead);
        closeFd(_wakeWrite);
    }

    const char* typeName() const override { return "PtySession"; }

    Result<void> start(const SpawnConfig& config) override {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_running) {
            return Err("session already running");
        }
        if (_reading) {
            return Err("previous session still draining");
        }
        if (config.command.empty()) {
            return Err("no command given");
        }

        int cols = config.cols > 0 ? config.cols : (_screen ? _screen->cols() : 0);
        int rows = config.rows > 0 ? config.rows : (_screen ? _screen->rows() : 0);
        if (cols <= 0 || rows <= 0) {
            cols = 80;
            rows = 24;
        }

        int statusPipe[2];
        if (::pipe2(statusPipe, O_CLOEXEC) != 0) {
            return Err(std::string("pipe2 failed: ") + strerror(errno));
        }

        struct winsize ws = {};
        ws.ws_col = static_cast<unsigned short>(cols);
        ws.ws_row = static_cast<unsigned short>(rows);

        int masterFd = -1;
        pid_t pid = forkpty(&masterFd, nullptr, nullptr, &ws);
        if (pid < 0) {
            int err = errno;
            ::close(statusPipe[0]);
            ::close(statusPipe[1]);
            return Err(std::string("forkpty failed: ") + strerror(err));
        }

        if (pid == 0) {
            execChild(config, statusPipe[1]);
        }

        // Parent
        ::close(statusPipe[1]);
        int childErrno = 0;
        ssize_t n;
        do {
            n = ::read(statusPipe[0], &childErrno, sizeof(childErrno));
        } while (n < 0 && errno == EINTR);
        ::close(statusPipe[0]);

        if (n == static_cast<ssize_t>(sizeof(childErrno))) {
            // exec failed; the child is on its way out
            int status = 0;
            ::waitpid(pid, &status, 0);
            ::close(masterFd);
            return Err("exec " + config.command + ": " + strerror(childErrno));
        }

        int wake[2];
        if (::pipe2(wake, O_CLOEXEC | O_NONBLOCK) != 0) {
            int err = errno;
            ::kill(pid, SIGKILL);
            int status = 0;
            ::waitpid(pid, &status, 0);
            ::close(masterFd);
            return Err(std::string("pipe2 failed: ") + strerror(err));
        }
        closeFd(_wakeRead);
        closeFd(_wakeWrite);
        _wakeRead = wake[0];
        _wakeWrite = wake[1];

        ::fcntl(masterFd, F_SETFD, FD_CLOEXEC);
        _masterFd = masterFd;
        _pid = pid;
        _cols = cols;
        _rows = rows;
        _running = true;
        _exitError.clear();

        yinfo("PtySession::start: pid={} fd={} cmd={} size={}x{}", pid, masterFd, config.command, cols, rows);
        return Ok();
    }

    Result<void> write(const std::string& data) override {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_running || _masterFd < 0) {
            return Ok();
        }
        size_t off = 0;
        while (off < data.size()) {
            ssize_t n = ::write(_masterFd, data.data() + off, data.size() - off);
            if (n < 0) {
                if (errno == EINTR) continue;
                return Err(std::string("pty write failed: ") + strerror(errno));
            }
            off += static_cast<size_t>(n);
        }
        return Ok();
    }

    Result<void> resize(int cols, int rows) override {
        if (cols <= 0 || rows <= 0) {
            return Err("invalid size " + std::to_string(cols) + "x" + std::to_string(rows));
        }
        if (_screen) {
            if (auto res = _screen->resize(cols, rows); !res) {
                return res;
            }
        }

        std::lock_guard<std::mutex> lock(_mutex);
        _cols = cols;
        _rows = rows;
        if (_running && _masterFd >= 0) {
            struct winsize ws = {};
            ws.ws_col = static_cast<unsigned short>(cols);
            ws.ws_row = static_cast<unsigned short>(rows);
            if (::ioctl(_masterFd, TIOCSWINSZ, &ws) < 0) {
                return Err(std::string("TIOCSWINSZ failed: ") + strerror(errno));
            }
        }
        return Ok();
    }

    Result<void> stop() override {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_running) {
            return Ok();
        }
        yinfo("PtySession::stop: pid={}", _pid);
        ::kill(-_pid, SIGKILL);
        ::kill(_pid, SIGKILL);

        if (_reading) {
            // The worker reaps and reports; wake it in case it is parked in poll()
            char b = 1;
            if (::write(_wakeWrite, &b, 1) < 0 && errno != EAGAIN) {
                ywarn("PtySession::stop: wake failed: {}", strerror(errno));
            }
            return Ok();
        }

        int status = 0;
        ::waitpid(_pid, &status, 0);
        finishLocked(describeWaitStatus(status));
        return Ok();
    }

    Result<void> requestRead(ReadCallback callback) override {
        auto job = std::make_shared<ReadJob>();
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!_running) {
                return Err("session not running");
            }
            if (_reading) {
                return Err("read already in flight");
            }
            _reading = true;
            job->fd = _masterFd;
            job->wakeFd = _wakeRead;
            job->pid = _pid;
        }

        auto self = sharedAs<PtySession>();
        auto res = _loop->queueWork(
            [job]() { readBlocking(*job); },
            [self, job, callback = std::move(callback)]() {
                self->onReadDone(*job, callback);
            });
        if (!res) {
            std::lock_guard<std::mutex> lock(_mutex);
            _reading = false;
            return Err("Failed to queue pty read", res);
        }
        return Ok();
    }

    bool isRunning() const override {
        std::lock_guard<std::mutex> lock(_mutex);
        return _running;
    }

    bool isReading() const override {
        std::lock_guard<std::mutex> lock(_mutex);
        return _reading;
    }

    std::string exitError() const override {
        std::lock_guard<std::mutex> lock(_mutex);
        return _exitError;
    }

private:
    [[noreturn]] static void execChild(const SpawnConfig& config, int statusFd) {
        // Drop inherited descriptors except the exec status pipe
        for (int fd = 3; fd < 1024; ++fd) {
            if (fd != statusFd) ::close(fd);
        }

        ::setenv("TERM", "xterm-256color", 1);
        for (const auto& [key, value] : config.env) {
            ::setenv(key.c_str(), value.c_str(), 1);
        }

        if (!config.workingDir.empty() && ::chdir(config.workingDir.c_str()) != 0) {
            int err = errno;
            ssize_t w = ::write(statusFd, &err, sizeof(err));
            (void)w;
            _exit(127);
        }

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(config.command.c_str()));
        for (const auto& arg : config.args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(config.command.c_str(), argv.data());

        int err = errno;
        ssize_t w = ::write(statusFd, &err, sizeof(err));
        (void)w;
        _exit(127);
    }

    // Runs on a pool thread; touches nothing but the job
    static void readBlocking(ReadJob& job) {
        struct pollfd fds[2] = {
            {job.fd, POLLIN, 0},
            {job.wakeFd, POLLIN, 0},
        };
        while (true) {
            int r = ::poll(fds, 2, -1);
            if (r < 0) {
                if (errno == EINTR) continue;
                job.n = -1;
                job.err = errno;
                break;
            }
            if (fds[1].revents & POLLIN) {
                job.woken = true;
                break;
            }
            if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
                job.data.resize(READ_BUFFER_SIZE);
                job.n = ::read(job.fd, job.data.data(), job.data.size());
                job.err = job.n < 0 ? errno : 0;
                break;
            }
        }

        bool finished = job.woken || job.n == 0 ||
                        (job.n < 0 && job.err != EINTR && job.err != EAGAIN);
        if (finished) {
            job.data.clear();
            if (::waitpid(job.pid, &job.waitStatus, 0) == job.pid) {
                job.reaped = true;
            }
        } else if (job.n > 0) {
            job.data.resize(static_cast<size_t>(job.n));
        } else {
            job.data.clear();
        }
    }

    void onReadDone(ReadJob& job, const ReadCallback& callback) {
        ReadResult result;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _reading = false;

            bool finished = job.woken || job.n == 0 ||
                            (job.n < 0 && job.err != EINTR && job.err != EAGAIN);
            if (!finished) {
                ydebug("PtySession: read {} bytes", job.n > 0 ? job.n : 0);
                result = ReadResult::output(std::move(job.data));
            } else {
                if (job.n < 0 && job.err != EIO) {
                    ywarn("PtySession: read failed: {}", strerror(job.err));
                }
                if (_running) {
                    finishLocked(job.reaped ? describeWaitStatus(job.waitStatus) : std::string());
                }
                result = ReadResult::exited(_exitError);
            }
        }
        if (callback) callback(std::move(result));
    }

    void finishLocked(std::string exitError) {
        yinfo("PtySession: pid={} exited{}{}", _pid, exitError.empty() ? "" : ": ", exitError);
        _exitError = std::move(exitError);
        _running = false;
        _pid = -1;
        closeFd(_masterFd);
        closeFd(_wakeRead);
        closeFd(_wakeWrite);
    }

    base::EventLoop::Ptr _loop;
    VirtualScreen::Ptr _screen;

    mutable std::mutex _mutex;
    int _masterFd = -1;
    pid_t _pid = -1;
    int _wakeRead = -1;
    int _wakeWrite = -1;
    int _cols = 0;
    int _rows = 0;
    bool _running = false;
    bool _reading = false;
    std::string _exitError;
};

Result<ProcessSession::Ptr> ProcessSession::create(base::EventLoop::Ptr loop, VirtualScreen::Ptr screen) noexcept {
    if (!loop) {
        return Err<Ptr>("ProcessSession::create: null event loop");
    }
    return Ok<Ptr>(std::make_shared<PtySession>(std::move(loop), std::move(screen)));
}

} // namespace vcmd
