/*
 * nanoclaw C++ - Mount Security Implementation
 */
#include <nanoclaw/core/mount_security.hpp>
#include <nanoclaw/core/logger.hpp>
#include <nanoclaw/core/utils.hpp>

#include <algorithm>

namespace nanoclaw {

static const char* EXTRA_MOUNT_ROOT = "/workspace/extra";

// ============================================================================
// Allowlist
// ============================================================================

bool AllowlistEntry::permits_group(const std::string& folder) const {
    if (groups.empty()) return true;
    return std::find(groups.begin(), groups.end(), folder) != groups.end();
}

bool MountAllowlist::parse(const Json& j, MountAllowlist& out, std::string& error) {
    if (!j.is_object()) {
        error = "allowlist must be a JSON object";
        return false;
    }

    MountAllowlist list;
    Json::const_iterator roots = j.find("allowedRoots");
    if (roots == j.end() || !roots->is_array()) {
        error = "allowlist has no 'allowedRoots' array";
        return false;
    }

    for (Json::const_iterator it = roots->begin(); it != roots->end(); ++it) {
        if (!it->is_object() || !it->contains("path") || !(*it)["path"].is_string()) {
            LOG_WARN("[MountSecurity] Skipping allowlist entry without a path");
            continue;
        }
        AllowlistEntry entry;
        entry.path = (*it)["path"].get<std::string>();
        entry.allow_read_write = it->value("allowReadWrite", false);
        entry.description = it->value("description", std::string());
        if (it->contains("groups") && (*it)["groups"].is_array()) {
            const Json& groups = (*it)["groups"];
            for (Json::const_iterator g = groups.begin(); g != groups.end(); ++g) {
                if (g->is_string()) entry.groups.push_back(g->get<std::string>());
            }
        }
        list.allowed_roots.push_back(entry);
    }

    Json::const_iterator blocked = j.find("blockedPatterns");
    if (blocked != j.end() && blocked->is_array()) {
        for (Json::const_iterator it = blocked->begin(); it != blocked->end(); ++it) {
            if (it->is_string() && !it->get<std::string>().empty()) {
                list.blocked_patterns.push_back(it->get<std::string>());
            }
        }
    }

    list.non_main_read_only = j.value("nonMainReadOnly", true);

    out = list;
    return true;
}

bool MountAllowlist::load(const std::string& path, MountAllowlist& out, std::string& error) {
    std::string content;
    if (!read_file(path, content)) {
        error = "cannot read allowlist " + path;
        return false;
    }
    try {
        return parse(Json::parse(content), out, error);
    } catch (const Json::exception& e) {
        error = "malformed allowlist " + path + ": " + e.what();
        return false;
    }
}

// ============================================================================
// Validator
// ============================================================================

MountSecurityValidator::MountSecurityValidator(const Settings& settings)
    : settings_(settings) {}

const std::vector<std::string>& MountSecurityValidator::blocked_components() {
    static const std::vector<std::string> components = {
        ".ssh", ".gnupg", ".gpg", ".aws", ".azure", ".gcloud", ".kube", ".docker",
        ".env", ".netrc", ".npmrc", ".pypirc", ".secret",
        "id_rsa", "id_ed25519", "id_ecdsa", "credentials", "private_key"
    };
    return components;
}

std::vector<std::string> MountSecurityValidator::sensitive_paths() const {
    std::vector<std::string> paths;
    std::string home = home_directory();
    if (!home.empty()) {
        const char* home_relative[] = {
            ".ssh", ".gnupg", ".aws", ".azure", ".kube", ".docker",
            ".config/gcloud", ".config/nanoclaw", NULL
        };
        for (int i = 0; home_relative[i] != NULL; ++i) {
            paths.push_back(join_path(home, home_relative[i]));
        }
    }
    paths.push_back("/etc/ssl/private");

    // The allowlist's own directory must never be reachable from a sandbox
    if (!settings_.allowlist_path.empty()) {
        std::string allowlist = normalize_path(settings_.allowlist_path);
        size_t slash = allowlist.rfind('/');
        std::string dir = (slash == std::string::npos || slash == 0) ? allowlist : allowlist.substr(0, slash);
        paths.push_back(dir);
    }
    if (!settings_.env_file.empty()) {
        paths.push_back(normalize_path(settings_.env_file));
    }

    // Also compare against symlink-resolved forms
    size_t n = paths.size();
    for (size_t i = 0; i < n; ++i) {
        std::string real;
        if (resolve_real_path(paths[i], real) && real != paths[i]) {
            paths.push_back(real);
        }
    }
    return paths;
}

bool MountSecurityValidator::is_sensitive(const std::string& path, const MountAllowlist& allowlist,
                                          std::string& matched) const {
    std::vector<std::string> sensitive = sensitive_paths();
    for (size_t i = 0; i < sensitive.size(); ++i) {
        // Either direction: mounting a parent would expose the sensitive path
        if (path_is_within(path, sensitive[i]) || path_is_within(sensitive[i], path)) {
            matched = sensitive[i];
            return true;
        }
    }

    std::vector<std::string> components = split(normalize_path(path), '/');
    const std::vector<std::string>& builtin = blocked_components();
    for (size_t i = 0; i < components.size(); ++i) {
        const std::string& part = components[i];
        if (part.empty()) continue;
        if (std::find(builtin.begin(), builtin.end(), part) != builtin.end()) {
            matched = part;
            return true;
        }
        for (size_t k = 0; k < allowlist.blocked_patterns.size(); ++k) {
            if (part.find(allowlist.blocked_patterns[k]) != std::string::npos) {
                matched = allowlist.blocked_patterns[k];
                return true;
            }
        }
    }
    return false;
}

bool MountSecurityValidator::valid_container_path(const std::string& path) {
    if (path.empty() || path[0] == '/') return false;
    if (path.find("..") != std::string::npos) return false;
    // ':' and ',' would split the launch argument
    if (path.find(':') != std::string::npos || path.find(',') != std::string::npos) return false;
    return trim(path) == path;
}

bool MountSecurityValidator::check(const MountRequest& request, const Group& group,
                                   const MountAllowlist& allowlist,
                                   MountMapping& out, std::string& reason) const {
    if (request.host_path.empty()) {
        reason = "empty host path";
        return false;
    }

    std::string literal = normalize_path(expand_home(request.host_path));
    std::string matched;
    if (is_sensitive(literal, allowlist, matched)) {
        reason = "path matches sensitive entry '" + matched + "'";
        return false;
    }

    std::string real;
    if (!resolve_real_path(literal, real)) {
        reason = "host path does not exist";
        return false;
    }
    if (is_sensitive(real, allowlist, matched)) {
        reason = "resolved path " + real + " matches sensitive entry '" + matched + "'";
        return false;
    }
    if (real.find(':') != std::string::npos || real.find(',') != std::string::npos) {
        reason = "host path contains ':' or ','";
        return false;
    }

    std::string container_path = request.container_path.empty() ? base_name(real) : request.container_path;
    if (!valid_container_path(container_path)) {
        reason = "invalid container path '" + container_path + "'";
        return false;
    }

    // Most specific root wins
    const AllowlistEntry* best = nullptr;
    size_t best_len = 0;
    bool scoped_out = false;
    for (size_t i = 0; i < allowlist.allowed_roots.size(); ++i) {
        const AllowlistEntry& entry = allowlist.allowed_roots[i];
        std::string root;
        if (!resolve_real_path(expand_home(entry.path), root)) {
            continue;
        }
        if (!path_is_within(real, root)) continue;
        if (!entry.permits_group(group.folder)) {
            scoped_out = true;
            continue;
        }
        if (best == nullptr || root.size() > best_len) {
            best = &entry;
            best_len = root.size();
        }
    }

    if (best == nullptr) {
        reason = scoped_out ? "allowlisted root is scoped to other groups"
                            : "path is not under any allowed root";
        return false;
    }

    bool readonly = request.readonly || !best->allow_read_write ||
                    (!group.is_main && allowlist.non_main_read_only);

    out = MountMapping(real, std::string(EXTRA_MOUNT_ROOT) + "/" + container_path, readonly);
    return true;
}

std::vector<MountMapping> MountSecurityValidator::validate(const std::vector<MountRequest>& requests,
                                                           const Group& group) const {
    std::vector<MountMapping> accepted;
    if (requests.empty()) {
        return accepted;
    }

    MountAllowlist allowlist;
    std::string error;
    if (!MountAllowlist::load(settings_.allowlist_path, allowlist, error)) {
        LOG_WARN("[MountSecurity] %s; rejecting %zu additional mount(s) for %s",
                 error.c_str(), requests.size(), group.name.c_str());
        return accepted;
    }
    return validate(requests, group, allowlist);
}

std::vector<MountMapping> MountSecurityValidator::validate(const std::vector<MountRequest>& requests,
                                                           const Group& group,
                                                           const MountAllowlist& allowlist) const {
    std::vector<MountMapping> accepted;
    for (size_t i = 0; i < requests.size(); ++i) {
        MountMapping mapping;
        std::string reason;
        if (check(requests[i], group, allowlist, mapping, reason)) {
            if (!requests[i].readonly && mapping.readonly) {
                LOG_INFO("[MountSecurity] %s: %s downgraded to read-only",
                         group.name.c_str(), mapping.host_path.c_str());
            }
            LOG_DEBUG("[MountSecurity] %s: accepted %s", group.name.c_str(), mapping.describe().c_str());
            accepted.push_back(mapping);
        } else {
            LOG_WARN("[MountSecurity] %s: rejected mount %s (%s)",
                     group.name.c_str(), requests[i].host_path.c_str(), reason.c_str());
        }
    }
    return accepted;
}

} // namespace nanoclaw
