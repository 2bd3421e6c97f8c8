/*
 * nanoclaw C++ - File-backed host state
 */
#include <nanoclaw/core/host_state.hpp>
#include <nanoclaw/core/logger.hpp>
#include <nanoclaw/core/utils.hpp>

namespace nanoclaw {

// Missing file = empty. Unreadable or malformed files are logged and empty.
static bool load_array(const std::string& path, Json& out) {
    if (!path_exists(path)) {
        return false;
    }
    std::string content;
    if (!read_file(path, content)) {
        LOG_WARN("[HostState] Cannot read %s", path.c_str());
        return false;
    }
    try {
        out = Json::parse(content);
    } catch (const Json::exception& e) {
        LOG_WARN("[HostState] Malformed %s: %s", path.c_str(), e.what());
        return false;
    }
    if (!out.is_array()) {
        LOG_WARN("[HostState] %s is not a JSON array", path.c_str());
        return false;
    }
    return true;
}

std::vector<ScheduledTask> JsonTaskSource::tasks() const {
    std::vector<ScheduledTask> out;
    Json doc;
    if (!load_array(path_, doc)) {
        return out;
    }
    for (Json::const_iterator it = doc.begin(); it != doc.end(); ++it) {
        ScheduledTask t;
        if (parse_scheduled_task(*it, t)) {
            out.push_back(t);
        } else {
            LOG_DEBUG("[HostState] Skipping task entry without id or groupFolder");
        }
    }
    return out;
}

std::vector<AvailableGroup> JsonChatDirectory::chats() const {
    std::vector<AvailableGroup> out;
    Json doc;
    if (!load_array(path_, doc)) {
        return out;
    }
    for (Json::const_iterator it = doc.begin(); it != doc.end(); ++it) {
        AvailableGroup g;
        if (parse_available_group(*it, g)) {
            out.push_back(g);
        }
    }
    return out;
}

} // namespace nanoclaw
