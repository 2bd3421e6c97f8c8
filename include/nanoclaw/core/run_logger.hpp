/*
 * nanoclaw C++ - Run Logger
 *
 * One diagnostic file per sandbox run under groups/<folder>/logs/.
 * Verbose mode records the full input, launch arguments, mounts and both
 * streams. Normal mode records only sizes and identifiers, plus a stderr
 * tail when the run failed.
 */
#ifndef nanoclaw_CORE_RUN_LOGGER_HPP
#define nanoclaw_CORE_RUN_LOGGER_HPP

#include "types.hpp"
#include "settings.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace nanoclaw {

struct RunRecord {
    int64_t timestamp_ms;
    std::string group_name;
    std::string group_folder;
    bool is_main;
    int64_t duration_ms;
    int exit_code;
    bool timed_out;
    bool stdout_truncated;
    bool stderr_truncated;
    std::string failure;          // empty on success

    JobInput input;
    std::vector<std::string> args;
    std::vector<MountMapping> mounts;
    std::string stdout_data;
    std::string stderr_data;

    RunRecord()
        : timestamp_ms(0), is_main(false), duration_ms(0), exit_code(-1)
        , timed_out(false), stdout_truncated(false), stderr_truncated(false) {}

    bool failed() const { return timed_out || exit_code != 0 || !failure.empty(); }
};

class RunLogger {
public:
    static const size_t STDERR_TAIL_BYTES = 500;

    explicit RunLogger(const Settings& settings);

    static std::string render(const RunRecord& record, bool verbose);

    // Never throws. Returns false (and logs) if the file could not be written.
    bool write(const RunRecord& record, std::string& path_out) const;

private:
    const Settings& settings_;
};

} // namespace nanoclaw

#endif // nanoclaw_CORE_RUN_LOGGER_HPP
