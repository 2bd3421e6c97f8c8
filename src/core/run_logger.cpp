/*
 * nanoclaw C++ - Run Logger Implementation
 */
#include <nanoclaw/core/run_logger.hpp>
#include <nanoclaw/core/logger.hpp>
#include <nanoclaw/core/utils.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace nanoclaw {

RunLogger::RunLogger(const Settings& settings)
    : settings_(settings) {}

std::string RunLogger::render(const RunRecord& r, bool verbose) {
    std::ostringstream out;
    out << "=== Container Run Log ===\n"
        << "Timestamp: " << format_timestamp_utc(r.timestamp_ms) << "\n"
        << "Group: " << r.group_name << "\n"
        << "Folder: " << r.group_folder << "\n"
        << "IsMain: " << (r.is_main ? "true" : "false") << "\n"
        << "Duration: " << r.duration_ms << "ms\n"
        << "Exit Code: " << r.exit_code << "\n"
        << "Timed Out: " << (r.timed_out ? "true" : "false") << "\n"
        << "Stdout Truncated: " << (r.stdout_truncated ? "true" : "false") << "\n"
        << "Stderr Truncated: " << (r.stderr_truncated ? "true" : "false") << "\n";
    if (!r.failure.empty()) {
        out << "Failure: " << r.failure << "\n";
    }
    out << "\n";

    if (verbose) {
        out << "=== Input ===\n" << dump_json(to_json(r.input), 2) << "\n\n"
            << "=== Container Args ===\n" << join(r.args, " ") << "\n\n"
            << "=== Mounts ===\n";
        for (size_t i = 0; i < r.mounts.size(); ++i) {
            out << r.mounts[i].describe() << "\n";
        }
        out << "\n=== Stderr" << (r.stderr_truncated ? " (TRUNCATED)" : "") << " ===\n"
            << r.stderr_data << "\n\n"
            << "=== Stdout" << (r.stdout_truncated ? " (TRUNCATED)" : "") << " ===\n"
            << r.stdout_data << "\n";
        return out.str();
    }

    out << "=== Input Summary ===\n"
        << "Prompt length: " << r.input.prompt.size() << " chars\n"
        << "Session ID: " << (r.input.session_id.empty() ? "new" : r.input.session_id) << "\n"
        << "Chat: " << r.input.chat_jid << "\n"
        << "Scheduled: " << (r.input.is_scheduled_task ? "true" : "false") << "\n\n"
        << "=== Mounts ===\n";
    for (size_t i = 0; i < r.mounts.size(); ++i) {
        out << r.mounts[i].container_path << (r.mounts[i].readonly ? " (ro)" : "") << "\n";
    }
    out << "\n";

    if (r.failed()) {
        out << "=== Stderr (last " << STDERR_TAIL_BYTES << " bytes) ===\n"
            << tail_safe(r.stderr_data, STDERR_TAIL_BYTES) << "\n";
    }
    return out.str();
}

bool RunLogger::write(const RunRecord& record, std::string& path_out) const {
    try {
        const std::string dir = settings_.logs_dir(record.group_folder);
        if (!ensure_directory(dir)) {
            LOG_WARN("[RunLogger] Cannot create log directory %s", dir.c_str());
            return false;
        }

        path_out = join_path(dir, "container-" + file_timestamp(record.timestamp_ms) + ".log");
        std::ofstream file(path_out.c_str(), std::ios::out | std::ios::trunc);
        if (!file) {
            LOG_WARN("[RunLogger] Cannot open %s: %s", path_out.c_str(), strerror(errno));
            return false;
        }
        file << render(record, settings_.log_verbose);
        file.flush();
        if (!file) {
            LOG_WARN("[RunLogger] Write to %s failed (disk full?)", path_out.c_str());
            return false;
        }
    } catch (const std::exception& e) {
        LOG_WARN("[RunLogger] Failed to write run log: %s", e.what());
        return false;
    }

    LOG_DEBUG("[RunLogger] Run log written to %s (verbose=%s)",
              path_out.c_str(), settings_.log_verbose ? "true" : "false");
    return true;
}

} // namespace nanoclaw
