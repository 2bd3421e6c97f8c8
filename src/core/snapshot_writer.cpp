/*
 * nanoclaw C++ - Snapshot Writer Implementation
 */
#include <nanoclaw/core/snapshot_writer.hpp>
#include <nanoclaw/core/logger.hpp>
#include <nanoclaw/core/utils.hpp>

namespace nanoclaw {

SnapshotWriter::SnapshotWriter(const Settings& settings)
    : settings_(settings) {}

std::vector<ScheduledTask> SnapshotWriter::visible_tasks(const std::string& folder, bool is_main,
                                                         const std::vector<ScheduledTask>& tasks) {
    if (is_main) {
        return tasks;
    }
    std::vector<ScheduledTask> own;
    for (size_t i = 0; i < tasks.size(); ++i) {
        if (tasks[i].group_folder == folder) {
            own.push_back(tasks[i]);
        }
    }
    return own;
}

std::vector<AvailableGroup> SnapshotWriter::visible_groups(bool is_main,
                                                           const std::vector<AvailableGroup>& groups,
                                                           const std::set<std::string>& registered_jids) {
    std::vector<AvailableGroup> visible;
    if (!is_main) {
        return visible;
    }
    for (size_t i = 0; i < groups.size(); ++i) {
        AvailableGroup g = groups[i];
        g.is_registered = g.is_registered || registered_jids.count(g.jid) > 0;
        visible.push_back(g);
    }
    return visible;
}

std::string SnapshotWriter::tasks_path(const std::string& folder) const {
    return join_path(settings_.ipc_dir(folder), "current_tasks.json");
}

std::string SnapshotWriter::groups_path(const std::string& folder) const {
    return join_path(settings_.ipc_dir(folder), "available_groups.json");
}

bool SnapshotWriter::write_tasks(const std::string& folder, bool is_main,
                                 const std::vector<ScheduledTask>& tasks) const {
    if (!ensure_directory(settings_.ipc_dir(folder))) {
        return false;
    }

    std::vector<ScheduledTask> visible = visible_tasks(folder, is_main, tasks);
    Json list = Json::array();
    for (size_t i = 0; i < visible.size(); ++i) {
        list.push_back(to_json(visible[i]));
    }

    if (!write_file_atomic(tasks_path(folder), dump_json(list, 2))) {
        LOG_ERROR("[SnapshotWriter] Failed to write task snapshot for %s", folder.c_str());
        return false;
    }
    LOG_DEBUG("[SnapshotWriter] %s: %zu of %zu task(s) visible",
              folder.c_str(), visible.size(), tasks.size());
    return true;
}

bool SnapshotWriter::write_groups(const std::string& folder, bool is_main,
                                  const std::vector<AvailableGroup>& groups,
                                  const std::set<std::string>& registered_jids) const {
    if (!ensure_directory(settings_.ipc_dir(folder))) {
        return false;
    }

    std::vector<AvailableGroup> visible = visible_groups(is_main, groups, registered_jids);
    Json list = Json::array();
    for (size_t i = 0; i < visible.size(); ++i) {
        list.push_back(to_json(visible[i]));
    }

    Json doc;
    doc["groups"] = list;
    doc["lastSync"] = format_timestamp_utc(current_timestamp_ms());

    if (!write_file_atomic(groups_path(folder), dump_json(doc, 2))) {
        LOG_ERROR("[SnapshotWriter] Failed to write group snapshot for %s", folder.c_str());
        return false;
    }
    return true;
}

} // namespace nanoclaw
