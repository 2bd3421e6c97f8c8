/*
 * nanoclaw C++ - Core types and their JSON forms
 */
#include <nanoclaw/core/types.hpp>
#include <nanoclaw/core/utils.hpp>

namespace nanoclaw {

static std::string string_field(const Json& j, const char* key, const std::string& default_val = "") {
    Json::const_iterator it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return default_val;
}

std::string MountMapping::describe() const {
    return host_path + " -> " + container_path + (readonly ? " (ro)" : "");
}

Json to_json(const JobInput& input) {
    Json j;
    j["prompt"] = input.prompt;
    if (!input.session_id.empty()) {
        j["sessionId"] = input.session_id;
    }
    j["groupFolder"] = input.group_folder;
    j["chatJid"] = input.chat_jid;
    j["isMain"] = input.is_main;
    j["currentTime"] = input.current_time;
    if (input.is_scheduled_task) {
        j["isScheduledTask"] = true;
    }
    return j;
}

Json to_json(const JobResult& result) {
    Json j;
    j["status"] = result.success() ? "success" : "error";
    j["result"] = result.has_result ? Json(result.result) : Json(nullptr);
    if (!result.new_session_id.empty()) {
        j["newSessionId"] = result.new_session_id;
    }
    if (!result.error.empty()) {
        j["error"] = result.error;
    }
    return j;
}

Json to_json(const ScheduledTask& task) {
    Json j;
    j["id"] = task.id;
    j["groupFolder"] = task.group_folder;
    j["prompt"] = task.prompt;
    j["schedule_type"] = task.schedule_type;
    j["schedule_value"] = task.schedule_value;
    j["status"] = task.status;
    j["next_run"] = task.next_run.empty() ? Json(nullptr) : Json(task.next_run);
    return j;
}

Json to_json(const AvailableGroup& group) {
    Json j;
    j["jid"] = group.jid;
    j["name"] = group.name;
    j["lastActivity"] = group.last_activity;
    j["isRegistered"] = group.is_registered;
    return j;
}

Json to_json(const MountRequest& mount) {
    Json j;
    j["hostPath"] = mount.host_path;
    if (!mount.container_path.empty()) {
        j["containerPath"] = mount.container_path;
    }
    j["readonly"] = mount.readonly;
    return j;
}

Json to_json(const Group& group) {
    Json j;
    j["name"] = group.name;
    j["folder"] = group.folder;
    j["trigger"] = group.trigger;
    j["added_at"] = group.added_at;

    if (group.config.timeout_ms > 0 || !group.config.additional_mounts.empty()) {
        Json cc = Json::object();
        if (group.config.timeout_ms > 0) {
            cc["timeout"] = group.config.timeout_ms;
        }
        if (!group.config.additional_mounts.empty()) {
            Json mounts = Json::array();
            for (size_t i = 0; i < group.config.additional_mounts.size(); ++i) {
                mounts.push_back(to_json(group.config.additional_mounts[i]));
            }
            cc["additionalMounts"] = mounts;
        }
        j["containerConfig"] = cc;
    }
    return j;
}

bool parse_job_result(const Json& j, JobResult& out, std::string& error) {
    if (!j.is_object()) {
        error = "result is not a JSON object";
        return false;
    }

    Json::const_iterator status = j.find("status");
    if (status == j.end() || !status->is_string()) {
        error = "missing string field 'status'";
        return false;
    }
    JobResult r;
    const std::string s = status->get<std::string>();
    if (s == "success") {
        r.status = JobStatus::SUCCESS;
    } else if (s == "error") {
        r.status = JobStatus::ERROR;
    } else {
        error = "unknown status '" + s + "'";
        return false;
    }

    Json::const_iterator result = j.find("result");
    if (result != j.end() && !result->is_null()) {
        if (!result->is_string()) {
            error = "field 'result' must be a string or null";
            return false;
        }
        r.has_result = true;
        r.result = result->get<std::string>();
    }

    Json::const_iterator session = j.find("newSessionId");
    if (session != j.end() && !session->is_null()) {
        if (!session->is_string()) {
            error = "field 'newSessionId' must be a string";
            return false;
        }
        r.new_session_id = session->get<std::string>();
    }

    Json::const_iterator err = j.find("error");
    if (err != j.end() && !err->is_null()) {
        if (!err->is_string()) {
            error = "field 'error' must be a string";
            return false;
        }
        r.error = err->get<std::string>();
    }
    if (r.status == JobStatus::ERROR && trim(r.error).empty()) {
        r.error = "sandbox reported an error without a message";
    }

    out = r;
    return true;
}

bool parse_mount_request(const Json& j, MountRequest& out) {
    if (!j.is_object()) return false;
    out.host_path = string_field(j, "hostPath");
    if (out.host_path.empty()) return false;
    out.container_path = string_field(j, "containerPath");
    Json::const_iterator ro = j.find("readonly");
    out.readonly = (ro == j.end() || !ro->is_boolean()) ? true : ro->get<bool>();
    return true;
}

bool parse_group(const std::string& jid, const Json& j, Group& out) {
    if (!j.is_object()) return false;
    Group g;
    g.jid = jid;
    g.name = string_field(j, "name");
    g.folder = string_field(j, "folder");
    g.trigger = string_field(j, "trigger");
    g.added_at = string_field(j, "added_at");
    if (g.folder.empty()) return false;

    Json::const_iterator cc = j.find("containerConfig");
    if (cc != j.end() && cc->is_object()) {
        Json::const_iterator timeout = cc->find("timeout");
        if (timeout != cc->end() && timeout->is_number()) {
            g.config.timeout_ms = timeout->get<int64_t>();
        }
        Json::const_iterator mounts = cc->find("additionalMounts");
        if (mounts != cc->end() && mounts->is_array()) {
            for (Json::const_iterator it = mounts->begin(); it != mounts->end(); ++it) {
                MountRequest m;
                if (parse_mount_request(*it, m)) {
                    g.config.additional_mounts.push_back(m);
                }
            }
        }
    }

    out = g;
    return true;
}

bool parse_scheduled_task(const Json& j, ScheduledTask& out) {
    if (!j.is_object()) return false;
    out.id = string_field(j, "id");
    out.group_folder = string_field(j, "groupFolder");
    out.prompt = string_field(j, "prompt");
    out.schedule_type = string_field(j, "schedule_type");
    out.schedule_value = string_field(j, "schedule_value");
    out.status = string_field(j, "status");
    out.next_run = string_field(j, "next_run");
    return !out.id.empty() && !out.group_folder.empty();
}

bool parse_available_group(const Json& j, AvailableGroup& out) {
    if (!j.is_object()) return false;
    out.jid = string_field(j, "jid");
    out.name = string_field(j, "name");
    out.last_activity = string_field(j, "lastActivity");
    Json::const_iterator reg = j.find("isRegistered");
    out.is_registered = (reg != j.end() && reg->is_boolean()) ? reg->get<bool>() : false;
    return !out.jid.empty();
}

} // namespace nanoclaw
