/*
 * nanoclaw C++ - Bounded child process execution
 *
 * posix_spawnp() keeps spawning safe while other threads run jobs: no code
 * runs in the child between fork and exec, and all pipe ends are O_CLOEXEC so
 * concurrent spawns never inherit each other's descriptors.
 */
#include <nanoclaw/core/process.hpp>
#include <nanoclaw/core/logger.hpp>
#include <nanoclaw/core/utils.hpp>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

extern char** environ;

namespace nanoclaw {

namespace {

// Owns one file descriptor
class ScopedFd {
public:
    ScopedFd() : fd_(-1) {}
    ~ScopedFd() { reset(); }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    ScopedFd(const ScopedFd&);
    ScopedFd& operator=(const ScopedFd&);

    int fd_;
};

bool make_pipe(ScopedFd& read_end, ScopedFd& write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// A write to a sandbox that already exited must fail with EPIPE, not kill us
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, []() { signal(SIGPIPE, SIG_IGN); });
}

// Emits complete lines; holds a trailing partial line until more arrives
class LineSplitter {
public:
    explicit LineSplitter(const std::function<void(const std::string&)>& sink) : sink_(sink) {}

    void feed(const char* data, size_t len) {
        if (!sink_) return;
        pending_.append(data, len);
        size_t start = 0;
        size_t nl;
        while ((nl = pending_.find('\n', start)) != std::string::npos) {
            emit(pending_.substr(start, nl - start));
            start = nl + 1;
        }
        pending_.erase(0, start);
        if (pending_.size() > 8192) {
            emit(pending_);
            pending_.clear();
        }
    }

    void flush() {
        if (!pending_.empty()) {
            emit(pending_);
            pending_.clear();
        }
    }

private:
    void emit(const std::string& line) {
        std::string t = trim(line);
        if (!t.empty()) sink_(t);
    }

    std::function<void(const std::string&)> sink_;
    std::string pending_;
};

void decode_status(int status, ProcessResult& result) {
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }
}

// Non-blocking reap until deadline_ms; true once the child is collected
bool wait_until(pid_t pid, int64_t deadline_ms, int& status) {
    for (;;) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) return true;
        if (w < 0 && errno != EINTR) return true;  // already reaped elsewhere
        if (monotonic_ms() >= deadline_ms) return false;
        usleep(5000);
    }
}

void terminate_group(pid_t pid, int64_t grace_ms, int& status) {
    kill(-pid, SIGTERM);
    if (wait_until(pid, monotonic_ms() + grace_ms, status)) {
        // Leader gone; make sure nothing else in its group survives
        kill(-pid, SIGKILL);
        return;
    }
    LOG_WARN("[Process] pid %d ignored SIGTERM for %lld ms, sending SIGKILL",
             static_cast<int>(pid), static_cast<long long>(grace_ms));
    kill(-pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

} // namespace

void CappedBuffer::append(const char* data, size_t len) {
    size_t room = data_.size() < cap_ ? cap_ - data_.size() : 0;
    size_t take = std::min(room, len);
    data_.append(data, take);
    dropped_ += len - take;
}

ProcessResult run_process(const ProcessOptions& options) {
    ProcessResult result;
    const int64_t start = monotonic_ms();

    if (options.argv.empty()) {
        result.spawn_error = "empty command";
        return result;
    }

    ignore_sigpipe_once();

    ScopedFd in_read, in_write, out_read, out_write, err_read, err_write;
    if (!make_pipe(in_read, in_write) || !make_pipe(out_read, out_write) ||
        !make_pipe(err_read, err_write)) {
        result.spawn_error = std::string("pipe failed: ") + strerror(errno);
        return result;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, in_read.get(), STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, out_write.get(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, err_write.get(), STDERR_FILENO);

    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    sigset_t no_mask;
    sigemptyset(&no_mask);
    posix_spawnattr_setsigdefault(&attr, &default_signals);
    posix_spawnattr_setsigmask(&attr, &no_mask);
    posix_spawnattr_setpgroup(&attr, 0);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);

    std::vector<char*> argv;
    for (size_t i = 0; i < options.argv.size(); ++i) {
        argv.push_back(const_cast<char*>(options.argv[i].c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, argv[0], &actions, &attr, &argv[0], environ);
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);

    if (rc != 0) {
        result.spawn_error = "failed to spawn '" + options.argv[0] + "': " + strerror(rc);
        result.duration_ms = monotonic_ms() - start;
        return result;
    }
    result.spawned = true;

    // Child holds its own copies now
    in_read.reset();
    out_write.reset();
    err_write.reset();

    set_nonblocking(in_write.get());
    set_nonblocking(out_read.get());
    set_nonblocking(err_read.get());

    const int64_t deadline = start + std::max<int64_t>(options.timeout_ms, 0);
    CappedBuffer out_buf(options.max_output_bytes);
    CappedBuffer err_buf(options.max_output_bytes);
    LineSplitter err_lines(options.on_stderr_line);
    size_t written = 0;
    if (options.stdin_data.empty()) {
        in_write.reset();
    }

    char chunk[65536];
    while (out_read.valid() || err_read.valid()) {
        int64_t remaining = deadline - monotonic_ms();
        if (remaining <= 0) {
            result.timed_out = true;
            break;
        }

        struct pollfd fds[3];
        ScopedFd* owners[3];
        nfds_t n = 0;
        if (in_write.valid()) {
            fds[n].fd = in_write.get();
            fds[n].events = POLLOUT;
            owners[n++] = &in_write;
        }
        if (out_read.valid()) {
            fds[n].fd = out_read.get();
            fds[n].events = POLLIN;
            owners[n++] = &out_read;
        }
        if (err_read.valid()) {
            fds[n].fd = err_read.get();
            fds[n].events = POLLIN;
            owners[n++] = &err_read;
        }
        for (nfds_t i = 0; i < n; ++i) fds[i].revents = 0;

        int ready = poll(fds, n, static_cast<int>(std::min<int64_t>(remaining, 1000)));
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("[Process] poll failed: %s", strerror(errno));
            break;
        }

        for (nfds_t i = 0; i < n; ++i) {
            if (fds[i].revents == 0) continue;
            ScopedFd* owner = owners[i];

            if (owner == &in_write) {
                if (fds[i].revents & (POLLERR | POLLHUP)) {
                    in_write.reset();  // sandbox closed its stdin early
                    continue;
                }
                ssize_t w = write(in_write.get(), options.stdin_data.data() + written,
                                  options.stdin_data.size() - written);
                if (w > 0) {
                    written += static_cast<size_t>(w);
                    if (written == options.stdin_data.size()) in_write.reset();
                } else if (w < 0 && errno != EAGAIN && errno != EINTR) {
                    in_write.reset();
                }
                continue;
            }

            ssize_t r = read(owner->get(), chunk, sizeof(chunk));
            if (r > 0) {
                if (owner == &out_read) {
                    out_buf.append(chunk, static_cast<size_t>(r));
                } else {
                    err_buf.append(chunk, static_cast<size_t>(r));
                    err_lines.feed(chunk, static_cast<size_t>(r));
                }
            } else if (r == 0 || (errno != EAGAIN && errno != EINTR)) {
                owner->reset();
            }
        }
    }
    in_write.reset();
    out_read.reset();
    err_read.reset();
    err_lines.flush();

    int status = 0;
    if (!result.timed_out && !wait_until(pid, deadline, status)) {
        result.timed_out = true;
    }
    if (result.timed_out) {
        LOG_DEBUG("[Process] Deadline of %lld ms reached, terminating pid %d",
                  static_cast<long long>(options.timeout_ms), static_cast<int>(pid));
        terminate_group(pid, options.kill_grace_ms, status);
    }
    decode_status(status, result);

    result.stdout_data = out_buf.data();
    result.stderr_data = err_buf.data();
    result.stdout_truncated = out_buf.truncated();
    result.stderr_truncated = err_buf.truncated();
    result.duration_ms = monotonic_ms() - start;
    return result;
}

} // namespace nanoclaw
