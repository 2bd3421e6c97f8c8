/*
 * nanoclaw C++ - Core types
 *
 * Tenants ("groups"), mount mappings, and the job input/result objects
 * exchanged with the sandbox as JSON.
 */
#ifndef nanoclaw_CORE_TYPES_HPP
#define nanoclaw_CORE_TYPES_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace nanoclaw {

// Extra host directory a tenant asks to see; subject to the allowlist
struct MountRequest {
    std::string host_path;
    std::string container_path;   // relative name under /workspace/extra
    bool readonly;

    MountRequest() : readonly(true) {}
    MountRequest(const std::string& host, const std::string& container, bool ro = true)
        : host_path(host), container_path(container), readonly(ro) {}
};

struct GroupConfig {
    std::vector<MountRequest> additional_mounts;
    int64_t timeout_ms;           // 0 = system default

    GroupConfig() : timeout_ms(0) {}
};

// A registered tenant
struct Group {
    std::string jid;              // chat identity on the messaging platform
    std::string name;
    std::string folder;           // storage folder, unique per tenant
    std::string trigger;
    std::string added_at;
    bool is_main;                 // the single privileged tenant
    GroupConfig config;

    Group() : is_main(false) {}
};

struct MountMapping {
    std::string host_path;
    std::string container_path;
    bool readonly;

    MountMapping() : readonly(false) {}
    MountMapping(const std::string& host, const std::string& container, bool ro)
        : host_path(host), container_path(container), readonly(ro) {}

    // "host -> container (ro)"
    std::string describe() const;
};

// One job, serialized once to the sandbox's stdin
struct JobInput {
    std::string prompt;
    std::string session_id;       // empty = new session
    std::string group_folder;
    std::string chat_jid;
    bool is_main;
    std::string current_time;     // host local time, ISO 8601
    bool is_scheduled_task;

    JobInput() : is_main(false), is_scheduled_task(false) {}
};

enum class JobStatus {
    SUCCESS,
    ERROR
};

struct JobResult {
    JobStatus status;
    bool has_result;              // false = result is null
    std::string result;
    std::string new_session_id;
    std::string error;

    JobResult() : status(JobStatus::ERROR), has_result(false) {}

    bool success() const { return status == JobStatus::SUCCESS; }

    static JobResult ok(const std::string& result, const std::string& session_id = "") {
        JobResult r;
        r.status = JobStatus::SUCCESS;
        r.has_result = true;
        r.result = result;
        r.new_session_id = session_id;
        return r;
    }

    static JobResult fail(const std::string& error) {
        JobResult r;
        r.status = JobStatus::ERROR;
        r.error = error;
        return r;
    }
};

// Scheduled task as seen by the sandbox in current_tasks.json
struct ScheduledTask {
    std::string id;
    std::string group_folder;
    std::string prompt;
    std::string schedule_type;    // "cron", "interval", "once"
    std::string schedule_value;
    std::string status;
    std::string next_run;         // empty = null
};

// Chat the privileged tenant may register, from available_groups.json
struct AvailableGroup {
    std::string jid;
    std::string name;
    std::string last_activity;
    bool is_registered;

    AvailableGroup() : is_registered(false) {}
};

// ============ JSON mapping ============

Json to_json(const JobInput& input);
Json to_json(const JobResult& result);
Json to_json(const ScheduledTask& task);
Json to_json(const AvailableGroup& group);
Json to_json(const MountRequest& mount);
Json to_json(const Group& group);

// Strict: the sandbox result protocol. Fails with a reason on any other shape.
bool parse_job_result(const Json& j, JobResult& out, std::string& error);

// Lenient: operator and host files. Missing fields take defaults.
bool parse_mount_request(const Json& j, MountRequest& out);
bool parse_group(const std::string& jid, const Json& j, Group& out);
bool parse_scheduled_task(const Json& j, ScheduledTask& out);
bool parse_available_group(const Json& j, AvailableGroup& out);

} // namespace nanoclaw

#endif // nanoclaw_CORE_TYPES_HPP
