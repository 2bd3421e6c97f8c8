/*
 * nanoclaw C++ - Sandbox Runner Implementation
 */
#include <nanoclaw/core/sandbox_runner.hpp>
#include <nanoclaw/core/group_registry.hpp>
#include <nanoclaw/core/process.hpp>
#include <nanoclaw/core/logger.hpp>
#include <nanoclaw/core/utils.hpp>

namespace nanoclaw {

SandboxRunner::SandboxRunner(const Settings& settings)
    : settings_(settings)
    , validator_(settings)
    , planner_(settings, validator_)
    , env_(settings)
    , extractor_()
    , run_logger_(settings) {}

int64_t SandboxRunner::timeout_for(const Group& group) const {
    return group.config.timeout_ms > 0 ? group.config.timeout_ms : settings_.container_timeout_ms;
}

void SandboxRunner::finish(RunRecord& record) const {
    std::string path;
    if (!run_logger_.write(record, path)) {
        LOG_WARN("[SandboxRunner] Run log for %s not written", record.group_name.c_str());
    }
}

JobResult SandboxRunner::run(const Group& group, const JobInput& input, RunRecord* record) const {
    RunRecord local;
    RunRecord& rec = record ? *record : local;
    rec = RunRecord();
    rec.timestamp_ms = current_timestamp_ms();
    rec.group_name = group.name;
    rec.group_folder = group.folder;
    rec.is_main = group.is_main;

    try {
        return execute(group, input, rec);
    } catch (const std::exception& e) {
        LOG_ERROR("[SandboxRunner] %s: unexpected failure: %s", group.name.c_str(), e.what());
        return JobResult::fail(std::string("Sandbox run failed: ") + e.what());
    }
}

JobResult SandboxRunner::execute(const Group& group, const JobInput& input, RunRecord& rec) const {
    if (!GroupRegistry::valid_folder(group.folder)) {
        LOG_ERROR("[SandboxRunner] %s: refusing invalid group folder '%s'",
                  group.name.c_str(), group.folder.c_str());
        return JobResult::fail("Invalid group folder: " + group.folder);
    }
    if (!ensure_directory(settings_.group_dir(group.folder)) ||
        !ensure_directory(settings_.logs_dir(group.folder))) {
        return JobResult::fail("Cannot create directories for group " + group.folder);
    }

    // Privilege comes from the registry, never from the job itself
    JobInput job = input;
    if (job.is_main != group.is_main) {
        LOG_WARN("[SandboxRunner] %s: job isMain=%s overridden by group registration",
                 group.name.c_str(), job.is_main ? "true" : "false");
        job.is_main = group.is_main;
    }
    if (job.group_folder.empty()) {
        job.group_folder = group.folder;
    }
    if (job.current_time.empty()) {
        job.current_time = format_timestamp_local(current_timestamp_ms());
    }
    rec.input = job;

    std::string env_error;
    if (!env_.write(env_error)) {
        LOG_ERROR("[SandboxRunner] %s: %s", group.name.c_str(), env_error.c_str());
        return JobResult::fail("Failed to prepare sandbox environment: " + env_error);
    }

    MountPlan plan = planner_.plan(group);
    if (!plan.ok) {
        LOG_ERROR("[SandboxRunner] %s: mount configuration error: %s",
                  group.name.c_str(), plan.error.c_str());
        return JobResult::fail("Mount configuration error: " + plan.error);
    }
    rec.mounts = plan.mounts;

    ProcessOptions options;
    options.argv.push_back(settings_.container_command);
    std::vector<std::string> args = MountPlanner::build_container_args(plan.mounts, settings_.container_image);
    options.argv.insert(options.argv.end(), args.begin(), args.end());
    options.stdin_data = dump_json(to_json(job));
    options.timeout_ms = timeout_for(group);
    options.max_output_bytes = settings_.max_output_bytes;
    options.kill_grace_ms = settings_.kill_grace_ms;

    const std::string folder = group.folder;
    options.on_stderr_line = [folder](const std::string& line) {
        if (line.find("Container time:") != std::string::npos ||
            line.find("TZ env:") != std::string::npos) {
            LOG_INFO("[container:%s] %s", folder.c_str(), line.c_str());
        } else {
            LOG_DEBUG("[container:%s] %s", folder.c_str(), line.c_str());
        }
    };
    rec.args = options.argv;

    for (size_t i = 0; i < plan.mounts.size(); ++i) {
        LOG_DEBUG("[SandboxRunner] mount %s", plan.mounts[i].describe().c_str());
    }
    LOG_INFO("[SandboxRunner] Spawning container for %s (%zu mounts, main=%s, timeout=%lldms)",
             group.name.c_str(), plan.mounts.size(), group.is_main ? "yes" : "no",
             static_cast<long long>(options.timeout_ms));

    ProcessResult proc = run_process(options);

    rec.duration_ms = proc.duration_ms;
    rec.exit_code = proc.exit_code;
    rec.timed_out = proc.timed_out;
    rec.stdout_truncated = proc.stdout_truncated;
    rec.stderr_truncated = proc.stderr_truncated;
    rec.stdout_data = proc.stdout_data;
    rec.stderr_data = proc.stderr_data;

    if (proc.stdout_truncated) {
        LOG_WARN("[SandboxRunner] %s: stdout truncated at %zu bytes",
                 group.name.c_str(), settings_.max_output_bytes);
    }
    if (proc.stderr_truncated) {
        LOG_WARN("[SandboxRunner] %s: stderr truncated at %zu bytes",
                 group.name.c_str(), settings_.max_output_bytes);
    }

    if (!proc.spawned) {
        rec.failure = proc.spawn_error;
        LOG_ERROR("[SandboxRunner] %s: %s", group.name.c_str(), proc.spawn_error.c_str());
        finish(rec);
        return JobResult::fail("Failed to start container: " + proc.spawn_error);
    }

    if (proc.timed_out) {
        std::string msg = "Container timed out after " + std::to_string(options.timeout_ms) + "ms";
        rec.failure = msg;
        LOG_ERROR("[SandboxRunner] %s: %s, killed", group.name.c_str(), msg.c_str());
        finish(rec);
        return JobResult::fail(msg);
    }

    if (proc.exit_code != 0) {
        std::string tail = tail_safe(proc.stderr_data, ERROR_TAIL_BYTES);
        rec.failure = "exit code " + std::to_string(proc.exit_code);
        LOG_ERROR("[SandboxRunner] %s: container exited with code %d after %lldms",
                  group.name.c_str(), proc.exit_code, static_cast<long long>(proc.duration_ms));
        finish(rec);
        return JobResult::fail("Container exited with code " + std::to_string(proc.exit_code) + ": " + tail);
    }

    JobResult result;
    std::string reason;
    if (!extractor_.try_extract(proc.stdout_data, result, reason)) {
        rec.failure = "output parse failure: " + reason;
        finish(rec);
        return extractor_.extract(proc.stdout_data);
    }

    finish(rec);
    LOG_INFO("[SandboxRunner] %s: completed in %lldms (status=%s, result=%s)",
             group.name.c_str(), static_cast<long long>(proc.duration_ms),
             result.success() ? "success" : "error", result.has_result ? "yes" : "no");
    return result;
}

} // namespace nanoclaw
