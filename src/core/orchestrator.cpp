/*
 * nanoclaw C++ - Orchestrator Implementation
 */
#include <nanoclaw/core/orchestrator.hpp>
#include <nanoclaw/core/logger.hpp>

#include <set>

namespace nanoclaw {

Orchestrator::Orchestrator(const Settings& settings, const GroupRegistry& registry,
                           const TaskSource& tasks, const ChatDirectory& chats)
    : registry_(registry)
    , tasks_(tasks)
    , chats_(chats)
    , snapshots_(settings)
    , runner_(settings) {}

void Orchestrator::write_snapshots(const Group& group) {
    // Snapshot failures are not fatal; the sandbox just sees stale or no state
    if (!snapshots_.write_tasks(group.folder, group.is_main, tasks_.tasks())) {
        LOG_WARN("[Orchestrator] %s: task snapshot not written", group.folder.c_str());
    }

    std::vector<std::string> jids = registry_.jids();
    std::set<std::string> registered(jids.begin(), jids.end());
    if (!snapshots_.write_groups(group.folder, group.is_main, chats_.chats(), registered)) {
        LOG_WARN("[Orchestrator] %s: group snapshot not written", group.folder.c_str());
    }
}

JobResult Orchestrator::submit(const Group& group, const JobInput& input) {
    if (!GroupRegistry::valid_folder(group.folder)) {
        LOG_ERROR("[Orchestrator] Refusing job for invalid group folder '%s'", group.folder.c_str());
        return JobResult::fail("Invalid group folder: " + group.folder);
    }

    try {
        std::unique_lock<std::mutex> lock = locks_.try_acquire(group.folder);
        if (!lock.owns_lock()) {
            LOG_INFO("[Orchestrator] %s: waiting for the running job to finish", group.folder.c_str());
            lock = locks_.acquire(group.folder);
        }

        write_snapshots(group);
        return runner_.run(group, input);
    } catch (const std::exception& e) {
        LOG_ERROR("[Orchestrator] %s: %s", group.folder.c_str(), e.what());
        return JobResult::fail(std::string("Job submission failed: ") + e.what());
    }
}

JobResult Orchestrator::submit(const std::string& folder, const JobInput& input) {
    Group group;
    if (!registry_.find_by_folder(folder, group)) {
        LOG_ERROR("[Orchestrator] No registered group with folder '%s'", folder.c_str());
        return JobResult::fail("Unknown group folder: " + folder);
    }
    return submit(group, input);
}

} // namespace nanoclaw
