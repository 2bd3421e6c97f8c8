/*
 * nanoclaw C++ - Mount Planner Implementation
 */
#include <nanoclaw/core/mount_planner.hpp>
#include <nanoclaw/core/group_registry.hpp>
#include <nanoclaw/core/logger.hpp>
#include <nanoclaw/core/utils.hpp>

namespace nanoclaw {

MountPlanner::MountPlanner(const Settings& settings, const MountSecurityValidator& validator)
    : settings_(settings)
    , validator_(validator) {}

bool MountPlanner::add(MountPlan& plan, const MountMapping& mapping) const {
    for (size_t i = 0; i < plan.mounts.size(); ++i) {
        if (plan.mounts[i].container_path == mapping.container_path) {
            plan.ok = false;
            plan.error = "duplicate container path " + mapping.container_path +
                         " (" + plan.mounts[i].host_path + " and " + mapping.host_path + ")";
            return false;
        }
    }
    plan.mounts.push_back(mapping);
    return true;
}

MountPlan MountPlanner::plan(const Group& group) const {
    MountPlan plan;
    plan.ok = true;

    // Every host path below is derived from the folder name
    if (!GroupRegistry::valid_folder(group.folder)) {
        plan.ok = false;
        plan.error = "invalid group folder '" + group.folder + "'";
        return plan;
    }

    const std::string group_dir = settings_.group_dir(group.folder);
    const std::string sessions_dir = settings_.sessions_dir(group.folder);
    const std::string ipc_dir = settings_.ipc_dir(group.folder);
    const std::string env_dir = settings_.env_dir();

    const char* required[] = { "group", "sessions", "ipc messages", "ipc tasks", "env" };
    const std::string dirs[] = {
        group_dir,
        sessions_dir,
        join_path(ipc_dir, "messages"),
        join_path(ipc_dir, "tasks"),
        env_dir
    };
    for (int i = 0; i < 5; ++i) {
        if (!ensure_directory(dirs[i])) {
            plan.ok = false;
            plan.error = std::string("cannot create ") + required[i] + " directory " + dirs[i];
            return plan;
        }
    }

    if (group.is_main) {
        add(plan, MountMapping(settings_.project_root, "/workspace/project", false));
        add(plan, MountMapping(group_dir, "/workspace/group", false));
    } else {
        add(plan, MountMapping(group_dir, "/workspace/group", false));
        if (is_directory(settings_.global_dir())) {
            add(plan, MountMapping(settings_.global_dir(), "/workspace/global", true));
        }
    }

    add(plan, MountMapping(sessions_dir, "/home/node/.claude", false));
    add(plan, MountMapping(ipc_dir, "/workspace/ipc", false));
    add(plan, MountMapping(env_dir, "/workspace/env-dir", true));

    std::vector<MountMapping> extras = validator_.validate(group.config.additional_mounts, group);
    for (size_t i = 0; i < extras.size() && plan.ok; ++i) {
        add(plan, extras[i]);
    }
    if (!plan.ok) {
        return plan;
    }

    std::string allowlist = normalize_path(settings_.allowlist_path);
    for (size_t i = 0; i < plan.mounts.size(); ++i) {
        if (path_is_within(allowlist, plan.mounts[i].host_path)) {
            plan.ok = false;
            plan.error = "mount " + plan.mounts[i].host_path + " would expose the mount allowlist " + allowlist;
            return plan;
        }
    }

    return plan;
}

std::vector<std::string> MountPlanner::build_container_args(const std::vector<MountMapping>& mounts,
                                                            const std::string& image) {
    std::vector<std::string> args;
    args.push_back("run");
    args.push_back("-i");
    args.push_back("--rm");

    for (size_t i = 0; i < mounts.size(); ++i) {
        const MountMapping& m = mounts[i];
        if (m.readonly) {
            args.push_back("--mount");
            args.push_back("type=bind,source=" + m.host_path + ",target=" + m.container_path + ",readonly");
        } else {
            args.push_back("-v");
            args.push_back(m.host_path + ":" + m.container_path);
        }
    }

    args.push_back(image);
    return args;
}

} // namespace nanoclaw
