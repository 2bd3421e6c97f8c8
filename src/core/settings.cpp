/*
 * nanoclaw C++ - Settings resolution
 */
#include <nanoclaw/core/settings.hpp>
#include <nanoclaw/core/logger.hpp>
#include <nanoclaw/core/utils.hpp>

#include <cstdlib>
#include <climits>
#include <unistd.h>

namespace nanoclaw {

static const int64_t DEFAULT_TIMEOUT_MS = 300000;
static const int64_t DEFAULT_MAX_OUTPUT = 10 * 1024 * 1024;
static const int64_t DEFAULT_KILL_GRACE_MS = 2000;

static std::string current_directory() {
    char buf[PATH_MAX];
    if (getcwd(buf, sizeof(buf)) != nullptr) {
        return std::string(buf);
    }
    return ".";
}

Settings::Settings()
    : main_group_folder("main")
    , container_command("container")
    , container_image("nanoclaw-agent:latest")
    , container_timeout_ms(DEFAULT_TIMEOUT_MS)
    , max_output_bytes(static_cast<size_t>(DEFAULT_MAX_OUTPUT))
    , kill_grace_ms(DEFAULT_KILL_GRACE_MS)
    , log_level("info")
    , log_verbose(false)
{}

Settings Settings::resolve(const Config& cfg, const std::map<std::string, std::string>& env) {
    Settings s;

    s.project_root = expand_home(cfg.get_string("paths.project_root", ""));
    if (s.project_root.empty()) {
        s.project_root = current_directory();
    }
    s.groups_dir = expand_home(cfg.get_string("paths.groups_dir", join_path(s.project_root, "groups")));
    s.data_dir = expand_home(cfg.get_string("paths.data_dir", join_path(s.project_root, "data")));
    s.env_file = expand_home(cfg.get_string("paths.env_file", join_path(s.project_root, ".env")));
    s.allowlist_path = expand_home(cfg.get_string("security.mount_allowlist",
                                                  "~/.config/nanoclaw/mount-allowlist.json"));
    s.main_group_folder = cfg.get_string("groups.main_folder", s.main_group_folder);

    s.container_command = cfg.get_string("container.command", s.container_command);
    s.container_image = cfg.get_string("container.image", s.container_image);
    s.container_timeout_ms = cfg.get_int("container.timeout_ms", DEFAULT_TIMEOUT_MS);
    int64_t max_output = cfg.get_int("container.max_output_bytes", DEFAULT_MAX_OUTPUT);
    s.kill_grace_ms = cfg.get_int("container.kill_grace_ms", DEFAULT_KILL_GRACE_MS);

    std::map<std::string, std::string>::const_iterator it = env.find("CONTAINER_TIMEOUT");
    if (it != env.end() && !it->second.empty()) {
        char* end = nullptr;
        long long v = strtoll(it->second.c_str(), &end, 10);
        if (end && *end == '\0' && v > 0) {
            s.container_timeout_ms = static_cast<int64_t>(v);
        } else {
            LOG_WARN("[Settings] Ignoring invalid CONTAINER_TIMEOUT='%s'", it->second.c_str());
        }
    }
    if (s.container_timeout_ms <= 0) {
        LOG_WARN("[Settings] Non-positive container timeout, using %lld ms",
                 static_cast<long long>(DEFAULT_TIMEOUT_MS));
        s.container_timeout_ms = DEFAULT_TIMEOUT_MS;
    }
    if (max_output <= 0) {
        LOG_WARN("[Settings] Non-positive max_output_bytes, using %lld",
                 static_cast<long long>(DEFAULT_MAX_OUTPUT));
        max_output = DEFAULT_MAX_OUTPUT;
    }
    s.max_output_bytes = static_cast<size_t>(max_output);
    if (s.kill_grace_ms < 0) {
        s.kill_grace_ms = 0;
    }

    s.log_level = to_lower(cfg.get_string("log_level", s.log_level));
    it = env.find("LOG_LEVEL");
    if (it != env.end() && !it->second.empty()) {
        s.log_level = to_lower(it->second);
    }
    s.log_verbose = (s.log_level == "debug" || s.log_level == "trace");

    s.timezone = cfg.get_string("timezone", "");
    it = env.find("TZ");
    if (it != env.end() && !it->second.empty()) {
        s.timezone = it->second;
    }

    return s;
}

Settings Settings::from_environment(const Config& cfg) {
    std::map<std::string, std::string> env;
    const char* keys[] = { "CONTAINER_TIMEOUT", "LOG_LEVEL", "TZ", NULL };
    for (int i = 0; keys[i] != NULL; ++i) {
        const char* v = getenv(keys[i]);
        if (v) env[keys[i]] = v;
    }
    return resolve(cfg, env);
}

std::string Settings::sessions_dir(const std::string& folder) const {
    return join_path(join_path(join_path(data_dir, "sessions"), folder), ".claude");
}

std::string Settings::ipc_dir(const std::string& folder) const {
    return join_path(join_path(data_dir, "ipc"), folder);
}

std::string Settings::env_dir() const {
    return join_path(data_dir, "env");
}

std::string Settings::group_dir(const std::string& folder) const {
    return join_path(groups_dir, folder);
}

std::string Settings::logs_dir(const std::string& folder) const {
    return join_path(group_dir(folder), "logs");
}

std::string Settings::global_dir() const {
    return join_path(groups_dir, "global");
}

} // namespace nanoclaw
