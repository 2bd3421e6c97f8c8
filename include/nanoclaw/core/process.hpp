/*
 * nanoclaw C++ - Bounded child process execution
 *
 * Spawns a command in its own process group with piped stdin/stdout/stderr,
 * feeds stdin in full and closes it, then drains both output pipes under a
 * per-stream byte cap until EOF. A single deadline covers the drain and the
 * exit wait; when it passes, the whole process group gets SIGTERM, then
 * SIGKILL after a grace period, and is reaped before returning.
 */
#ifndef nanoclaw_CORE_PROCESS_HPP
#define nanoclaw_CORE_PROCESS_HPP

#include <string>
#include <vector>
#include <functional>
#include <cstdint>

namespace nanoclaw {

struct ProcessOptions {
    std::vector<std::string> argv;      // argv[0] is looked up in PATH
    std::string stdin_data;
    int64_t timeout_ms;
    size_t max_output_bytes;            // per stream
    int64_t kill_grace_ms;

    // Called for each complete stderr line as it arrives, before any cap
    std::function<void(const std::string&)> on_stderr_line;

    ProcessOptions() : timeout_ms(0), max_output_bytes(0), kill_grace_ms(0) {}
};

struct ProcessResult {
    bool spawned;
    std::string spawn_error;
    bool timed_out;
    int exit_code;                      // 128 + signal when killed by one
    int term_signal;                    // 0 unless killed by a signal
    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated;
    bool stderr_truncated;
    int64_t duration_ms;

    ProcessResult()
        : spawned(false), timed_out(false), exit_code(-1), term_signal(0)
        , stdout_truncated(false), stderr_truncated(false), duration_ms(0) {}
};

// Accumulates one stream up to a cap; bytes past the cap are counted and
// dropped so the writer never blocks on a full pipe.
class CappedBuffer {
public:
    explicit CappedBuffer(size_t cap) : cap_(cap), dropped_(0) {}

    void append(const char* data, size_t len);

    const std::string& data() const { return data_; }
    bool truncated() const { return dropped_ > 0; }
    size_t dropped() const { return dropped_; }

private:
    size_t cap_;
    size_t dropped_;
    std::string data_;
};

ProcessResult run_process(const ProcessOptions& options);

} // namespace nanoclaw

#endif // nanoclaw_CORE_PROCESS_HPP
