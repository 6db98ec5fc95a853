/**
 * @file process.cpp
 * @brief fork/exec process runner with poll()-driven output capture.
 * @author Dimitris Kafetzis
 */

#include "executor/process.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace parallel_orchestrator {

namespace {

/// Owns one end of a pipe.
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { reset(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& other) noexcept : fd_(other.release()) {}
    Fd& operator=(Fd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.release();
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
    int release() noexcept { int fd = fd_; fd_ = -1; return fd; }
    void reset() noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_ = -1;
};

Result<std::pair<Fd, Fd>> make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Error{ErrorKind::ExecutorFailure,
                     "pipe failed: " + std::string(strerror(errno))};
    }
    return std::pair<Fd, Fd>{Fd{fds[0]}, Fd{fds[1]}};
}

/// One captured output stream: in-memory copy plus optional file.
struct Stream {
    Fd fd;
    std::string* text = nullptr;
    std::ofstream file;

    void consume(const char* data, size_t n) {
        if (file.is_open()) file.write(data, static_cast<std::streamsize>(n));
        if (text->size() < kMaxCapturedBytes) {
            text->append(data, std::min(n, kMaxCapturedBytes - text->size()));
        }
    }
};

/// Read whatever is available. Returns false once the stream hit EOF.
bool drain(Stream& s) {
    char buf[8192];
    while (true) {
        ssize_t n = ::read(s.fd.get(), buf, sizeof(buf));
        if (n > 0) {
            s.consume(buf, static_cast<size_t>(n));
            if (static_cast<size_t>(n) < sizeof(buf)) return true;
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

/// Runs between fork and exec: async-signal-safe calls only, no allocation.
[[noreturn]] void exec_child(char* const* argv, const char* working_dir,
                             int out_fd, int err_fd, int status_fd) {
    ::setpgid(0, 0);

    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::dup2(out_fd, STDOUT_FILENO);
    ::dup2(err_fd, STDERR_FILENO);

    if (working_dir != nullptr && ::chdir(working_dir) != 0) {
        int err = errno;
        [[maybe_unused]] auto w = ::write(status_fd, &err, sizeof(err));
        ::_exit(127);
    }

    ::execvp(argv[0], argv);

    int err = errno;
    [[maybe_unused]] auto w = ::write(status_fd, &err, sizeof(err));
    ::_exit(127);
}

}  // anonymous namespace

Result<ProcessOutcome> run_process(const ProcessOptions& options, std::stop_token stop) {
    if (options.argv.empty() || options.argv.front().empty()) {
        return Error{ErrorKind::InvalidArgument, "empty command"};
    }

    ProcessOutcome outcome;
    Stream out_stream, err_stream;
    out_stream.text = &outcome.stdout_text;
    err_stream.text = &outcome.stderr_text;

    if (options.stdout_path) {
        out_stream.file.open(*options.stdout_path, std::ios::binary | std::ios::trunc);
        if (!out_stream.file) {
            return Error{ErrorKind::ExecutorFailure,
                         "cannot open output file " + options.stdout_path->string()};
        }
    }
    if (options.stderr_path) {
        err_stream.file.open(*options.stderr_path, std::ios::binary | std::ios::trunc);
        if (!err_stream.file) {
            return Error{ErrorKind::ExecutorFailure,
                         "cannot open output file " + options.stderr_path->string()};
        }
    }

    auto out_pipe = make_pipe();
    if (!out_pipe) return out_pipe.error();
    auto err_pipe = make_pipe();
    if (!err_pipe) return err_pipe.error();
    auto status_pipe = make_pipe();
    if (!status_pipe) return status_pipe.error();

    std::vector<char*> argv;
    argv.reserve(options.argv.size() + 1);
    for (const auto& arg : options.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const char* working_dir = options.working_dir.empty() ? nullptr : options.working_dir.c_str();

    const auto started = std::chrono::steady_clock::now();

    pid_t pid = ::fork();
    if (pid < 0) {
        return Error{ErrorKind::ExecutorFailure, "fork failed: " + std::string(strerror(errno))};
    }
    if (pid == 0) {
        exec_child(argv.data(), working_dir, out_pipe->second.get(), err_pipe->second.get(),
                   status_pipe->second.get());
    }

    // Parent: keep read ends only.
    out_pipe->second.reset();
    err_pipe->second.reset();
    status_pipe->second.reset();
    ::setpgid(pid, pid);

    // The status pipe closes on successful exec (CLOEXEC) or carries errno.
    int child_errno = 0;
    ssize_t got;
    do {
        got = ::read(status_pipe->first.get(), &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        return Error{ErrorKind::ExecutorFailure,
                     "cannot execute '" + options.argv.front() + "': " + strerror(child_errno)};
    }

    out_stream.fd = std::move(out_pipe->first);
    err_stream.fd = std::move(err_pipe->first);
    ::fcntl(out_stream.fd.get(), F_SETFL, O_NONBLOCK);
    ::fcntl(err_stream.fd.get(), F_SETFL, O_NONBLOCK);

    std::optional<std::chrono::steady_clock::time_point> term_sent;
    bool killed = false;
    bool exited = false;
    int wait_error = 0;
    int status = 0;

    auto terminate = [&](bool timeout) {
        if (term_sent) return;
        if (timeout) outcome.timed_out = true; else outcome.stopped = true;
        ::kill(-pid, SIGTERM);
        term_sent = std::chrono::steady_clock::now();
    };

    while (!exited) {
        pollfd pfds[2];
        nfds_t count = 0;
        if (out_stream.fd.valid()) pfds[count++] = {out_stream.fd.get(), POLLIN, 0};
        if (err_stream.fd.valid()) pfds[count++] = {err_stream.fd.get(), POLLIN, 0};

        const int wait_ms = static_cast<int>(options.poll_interval.count());
        if (count > 0) {
            int ready = ::poll(pfds, count, wait_ms);
            if (ready > 0) {
                for (nfds_t i = 0; i < count; ++i) {
                    if (pfds[i].revents == 0) continue;
                    Stream& s = pfds[i].fd == out_stream.fd.get() ? out_stream : err_stream;
                    if (!drain(s)) s.fd.reset();
                }
            }
        } else {
            std::this_thread::sleep_for(options.poll_interval);
        }

        // WNOWAIT leaves the leader a zombie, so its process group id cannot
        // be reused before the stray-descendant kill below.
        siginfo_t info{};
        int r = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
        if (r == 0 && info.si_pid == pid) {
            exited = true;
            break;
        }
        if (r < 0 && errno != EINTR) {
            wait_error = errno;
            break;
        }

        const auto now = std::chrono::steady_clock::now();
        if (options.timeout.count() > 0 && now - started >= options.timeout) terminate(true);
        if (stop.stop_requested()) terminate(false);
        if (term_sent && !killed && now - *term_sent >= options.kill_grace) {
            ::kill(-pid, SIGKILL);
            killed = true;
        }
    }

    // Collect output still buffered in the pipes.
    if (out_stream.fd.valid()) drain(out_stream);
    if (err_stream.fd.valid()) drain(err_stream);
    if (!exited) {
        return Error{ErrorKind::ExecutorFailure,
                     "waiting for '" + options.argv.front() + "' failed: " + strerror(wait_error)};
    }

    // Stray descendants may still hold the pipes open. ESRCH means none are left.
    [[maybe_unused]] int group_signalled = ::kill(-pid, SIGKILL);
    pid_t reaped;
    do {
        reaped = ::waitpid(pid, &status, 0);
    } while (reaped < 0 && errno == EINTR);

    outcome.elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started);
    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.term_signal = WTERMSIG(status);
    }
    return outcome;
}

}  // namespace parallel_orchestrator
