/*
 * nanoclaw C++ - Sandbox Runner
 *
 * Runs one job for one tenant in a fresh container:
 *
 *   1. ensure the tenant's group and log directories exist
 *   2. project the environment file and plan the mounts
 *   3. spawn `<command> run -i --rm <mounts> <image>` and write the job
 *      JSON to its stdin
 *   4. drain stdout/stderr under the output cap until exit or timeout
 *   5. timed out    -> error naming the timeout, output not trusted
 *      non-zero     -> error with exit code and stderr tail
 *      otherwise    -> result recovered by OutputExtractor
 *   6. write the run log
 *
 * run() never throws; every failure comes back as status=error.
 */
#ifndef nanoclaw_CORE_SANDBOX_RUNNER_HPP
#define nanoclaw_CORE_SANDBOX_RUNNER_HPP

#include "types.hpp"
#include "settings.hpp"
#include "mount_security.hpp"
#include "mount_planner.hpp"
#include "env_projector.hpp"
#include "output_extractor.hpp"
#include "run_logger.hpp"
#include <string>

namespace nanoclaw {

class SandboxRunner {
public:
    static const size_t ERROR_TAIL_BYTES = 200;

    explicit SandboxRunner(const Settings& settings);

    // record, when given, receives the run's diagnostic record
    JobResult run(const Group& group, const JobInput& input, RunRecord* record = nullptr) const;

    // Effective timeout for a tenant
    int64_t timeout_for(const Group& group) const;

private:
    SandboxRunner(const SandboxRunner&);
    SandboxRunner& operator=(const SandboxRunner&);

    JobResult execute(const Group& group, const JobInput& input, RunRecord& record) const;
    void finish(RunRecord& record) const;

    const Settings& settings_;
    MountSecurityValidator validator_;
    MountPlanner planner_;
    EnvironmentProjector env_;
    OutputExtractor extractor_;
    RunLogger run_logger_;
};

} // namespace nanoclaw

#endif // nanoclaw_CORE_SANDBOX_RUNNER_HPP
