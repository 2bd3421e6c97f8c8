/*
 * nanoclaw C++ - Resolved runtime settings
 *
 * Built once at startup from Config and the process environment, then
 * passed by reference into every component. Nothing below this layer
 * calls getenv().
 */
#ifndef nanoclaw_CORE_SETTINGS_HPP
#define nanoclaw_CORE_SETTINGS_HPP

#include "config.hpp"
#include <map>
#include <string>
#include <cstdint>

namespace nanoclaw {

struct Settings {
    std::string project_root;
    std::string groups_dir;
    std::string data_dir;
    std::string env_file;
    std::string allowlist_path;
    std::string main_group_folder;

    std::string container_command;
    std::string container_image;
    int64_t container_timeout_ms;
    size_t max_output_bytes;
    int64_t kill_grace_ms;

    std::string log_level;
    bool log_verbose;       // full run records (debug/trace)
    std::string timezone;   // empty = detect from the host

    Settings();

    // Environment keys consulted: CONTAINER_TIMEOUT, LOG_LEVEL, TZ
    static Settings resolve(const Config& cfg, const std::map<std::string, std::string>& env);

    // resolve() against a snapshot of the current process environment
    static Settings from_environment(const Config& cfg);

    std::string sessions_dir(const std::string& folder) const;
    std::string ipc_dir(const std::string& folder) const;
    std::string env_dir() const;
    std::string group_dir(const std::string& folder) const;
    std::string logs_dir(const std::string& folder) const;
    std::string global_dir() const;
};

} // namespace nanoclaw

#endif // nanoclaw_CORE_SETTINGS_HPP
