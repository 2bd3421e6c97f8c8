/*
 * nanoclaw C++ - Orchestrator
 *
 * Entry point for job submission. For one tenant at a time:
 * take the tenant's run lock, refresh its snapshots, run the sandbox.
 */
#ifndef nanoclaw_CORE_ORCHESTRATOR_HPP
#define nanoclaw_CORE_ORCHESTRATOR_HPP

#include "types.hpp"
#include "settings.hpp"
#include "group_registry.hpp"
#include "host_state.hpp"
#include "run_locks.hpp"
#include "sandbox_runner.hpp"
#include "snapshot_writer.hpp"

namespace nanoclaw {

class Orchestrator {
public:
    Orchestrator(const Settings& settings, const GroupRegistry& registry,
                 const TaskSource& tasks, const ChatDirectory& chats);

    // Blocks until the job completes or times out. Never throws.
    JobResult submit(const Group& group, const JobInput& input);

    // Looks the tenant up by folder first
    JobResult submit(const std::string& folder, const JobInput& input);

    const SandboxRunner& runner() const { return runner_; }

private:
    Orchestrator(const Orchestrator&);
    Orchestrator& operator=(const Orchestrator&);

    void write_snapshots(const Group& group);

    const GroupRegistry& registry_;
    const TaskSource& tasks_;
    const ChatDirectory& chats_;
    SnapshotWriter snapshots_;
    SandboxRunner runner_;
    GroupRunLocks locks_;
};

} // namespace nanoclaw

#endif // nanoclaw_CORE_ORCHESTRATOR_HPP
