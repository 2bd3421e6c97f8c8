/*
 * nanoclaw C++ - Snapshot Writer
 *
 * One-way state projections the sandbox reads from its IPC directory and
 * the host never reads back:
 *
 *   ipc/<folder>/current_tasks.json     main: every task; others: own tasks
 *   ipc/<folder>/available_groups.json  main: all discoverable chats;
 *                                       others: empty list
 *
 * Both are replaced atomically before each run.
 */
#ifndef nanoclaw_CORE_SNAPSHOT_WRITER_HPP
#define nanoclaw_CORE_SNAPSHOT_WRITER_HPP

#include "types.hpp"
#include "settings.hpp"
#include <set>
#include <string>
#include <vector>

namespace nanoclaw {

class SnapshotWriter {
public:
    explicit SnapshotWriter(const Settings& settings);

    static std::vector<ScheduledTask> visible_tasks(const std::string& folder, bool is_main,
                                                    const std::vector<ScheduledTask>& tasks);

    static std::vector<AvailableGroup> visible_groups(bool is_main,
                                                      const std::vector<AvailableGroup>& groups,
                                                      const std::set<std::string>& registered_jids);

    bool write_tasks(const std::string& folder, bool is_main,
                     const std::vector<ScheduledTask>& tasks) const;

    bool write_groups(const std::string& folder, bool is_main,
                      const std::vector<AvailableGroup>& groups,
                      const std::set<std::string>& registered_jids) const;

    std::string tasks_path(const std::string& folder) const;
    std::string groups_path(const std::string& folder) const;

private:
    const Settings& settings_;
};

} // namespace nanoclaw

#endif // nanoclaw_CORE_SNAPSHOT_WRITER_HPP
