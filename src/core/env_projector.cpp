/*
 * nanoclaw C++ - Environment Projector Implementation
 *
 * Only allow-listed auth variables leave the host .env; everything else
 * stays behind.
 */
#include <nanoclaw/core/env_projector.hpp>
#include <nanoclaw/core/logger.hpp>
#include <nanoclaw/core/utils.hpp>

#include <climits>
#include <unistd.h>

namespace nanoclaw {

EnvironmentProjector::EnvironmentProjector(const Settings& settings)
    : settings_(settings) {}

const std::vector<std::string>& EnvironmentProjector::allowed_names() {
    static const std::vector<std::string> names = {
        "CLAUDE_CODE_OAUTH_TOKEN",
        "ANTHROPIC_API_KEY"
    };
    return names;
}

std::vector<std::string> EnvironmentProjector::filter_lines(const std::string& content) {
    std::vector<std::string> kept;
    std::vector<std::string> lines = split(content, '\n');
    const std::vector<std::string>& names = allowed_names();

    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = trim(lines[i]);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        for (size_t n = 0; n < names.size(); ++n) {
            if (starts_with(line, names[n] + "=")) {
                kept.push_back(line);
                break;
            }
        }
    }
    return kept;
}

std::string EnvironmentProjector::detect_system_timezone() {
    char target[PATH_MAX];
    ssize_t len = readlink("/etc/localtime", target, sizeof(target) - 1);
    if (len > 0) {
        target[len] = '\0';
        std::string link(target);
        const std::string marker = "zoneinfo/";
        size_t pos = link.find(marker);
        if (pos != std::string::npos && pos + marker.size() < link.size()) {
            return link.substr(pos + marker.size());
        }
    }

    std::string content;
    if (read_file("/etc/timezone", content)) {
        std::string tz = trim(content);
        if (!tz.empty()) {
            return tz;
        }
    }
    return "UTC";
}

std::string EnvironmentProjector::timezone() const {
    if (!settings_.timezone.empty()) {
        return settings_.timezone;
    }
    return detect_system_timezone();
}

std::string EnvironmentProjector::render() const {
    std::vector<std::string> lines;

    std::string content;
    if (path_exists(settings_.env_file)) {
        if (read_file(settings_.env_file, content)) {
            lines = filter_lines(content);
        } else {
            LOG_WARN("[EnvProjector] Cannot read %s; no secrets exported", settings_.env_file.c_str());
        }
    }

    lines.push_back("TZ=" + timezone());
    return join(lines, "\n") + "\n";
}

std::string EnvironmentProjector::env_file_path() const {
    return join_path(settings_.env_dir(), "env");
}

bool EnvironmentProjector::write(std::string& error) const {
    if (!ensure_directory(settings_.env_dir())) {
        error = "cannot create " + settings_.env_dir();
        return false;
    }
    if (!write_file_atomic(env_file_path(), render())) {
        error = "cannot write " + env_file_path();
        return false;
    }
    LOG_DEBUG("[EnvProjector] Wrote %s", env_file_path().c_str());
    return true;
}

} // namespace nanoclaw
