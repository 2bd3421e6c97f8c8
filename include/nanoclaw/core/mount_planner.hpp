/*
 * nanoclaw C++ - Mount Planner
 *
 * Builds the ordered host -> sandbox directory mappings for one run:
 *
 *   main:   project root        -> /workspace/project   (rw)
 *           groups/<folder>     -> /workspace/group     (rw)
 *   others: groups/<folder>     -> /workspace/group     (rw)
 *           groups/global       -> /workspace/global    (ro, if present)
 *   all:    sessions/<folder>   -> /home/node/.claude   (rw)
 *           ipc/<folder>        -> /workspace/ipc       (rw)
 *           env/                -> /workspace/env-dir   (ro)
 *           validated extras    -> /workspace/extra/*
 *
 * Session and IPC directories are keyed by tenant folder, so no two tenants
 * ever share them.
 */
#ifndef nanoclaw_CORE_MOUNT_PLANNER_HPP
#define nanoclaw_CORE_MOUNT_PLANNER_HPP

#include "types.hpp"
#include "settings.hpp"
#include "mount_security.hpp"
#include <string>
#include <vector>

namespace nanoclaw {

struct MountPlan {
    bool ok;
    std::string error;
    std::vector<MountMapping> mounts;

    MountPlan() : ok(false) {}
};

class MountPlanner {
public:
    MountPlanner(const Settings& settings, const MountSecurityValidator& validator);

    // Creates the tenant directories it maps. Fails on a duplicate sandbox
    // path or when a mapping would expose the mount allowlist.
    MountPlan plan(const Group& group) const;

    // "run -i --rm" + one bind option per mapping + image
    static std::vector<std::string> build_container_args(const std::vector<MountMapping>& mounts,
                                                         const std::string& image);

private:
    bool add(MountPlan& plan, const MountMapping& mapping) const;

    const Settings& settings_;
    const MountSecurityValidator& validator_;
};

} // namespace nanoclaw

#endif // nanoclaw_CORE_MOUNT_PLANNER_HPP
