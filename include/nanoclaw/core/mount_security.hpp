/*
 * nanoclaw C++ - Mount Security
 *
 * Gate for tenant-requested extra mounts. Requests are checked against an
 * operator-maintained allowlist that lives outside every mount handed to a
 * sandbox, so no sandbox can widen its own access.
 *
 * Policy, in order:
 *   1. Reject anything that is, contains, or lies under a sensitive path
 *      (credential stores, key directories, the allowlist itself).
 *   2. Accept only paths at or beneath an allowlisted root.
 *   3. Read-write only if the request, the root and the tenant all allow it.
 *   4. Roots scoped to tenants accept only those tenants.
 *
 * Rejections are logged and dropped; nothing is thrown to the caller.
 */
#ifndef nanoclaw_CORE_MOUNT_SECURITY_HPP
#define nanoclaw_CORE_MOUNT_SECURITY_HPP

#include "types.hpp"
#include "settings.hpp"
#include <string>
#include <vector>

namespace nanoclaw {

struct AllowlistEntry {
    std::string path;
    bool allow_read_write;
    std::string description;
    std::vector<std::string> groups;  // empty = any tenant

    AllowlistEntry() : allow_read_write(false) {}

    bool permits_group(const std::string& folder) const;
};

struct MountAllowlist {
    std::vector<AllowlistEntry> allowed_roots;
    std::vector<std::string> blocked_patterns;
    bool non_main_read_only;

    MountAllowlist() : non_main_read_only(true) {}

    static bool parse(const Json& j, MountAllowlist& out, std::string& error);
    static bool load(const std::string& path, MountAllowlist& out, std::string& error);
};

class MountSecurityValidator {
public:
    explicit MountSecurityValidator(const Settings& settings);

    // Re-reads the allowlist file on every call
    std::vector<MountMapping> validate(const std::vector<MountRequest>& requests,
                                       const Group& group) const;

    std::vector<MountMapping> validate(const std::vector<MountRequest>& requests,
                                       const Group& group,
                                       const MountAllowlist& allowlist) const;

    // Single request. On rejection returns false and sets reason.
    bool check(const MountRequest& request, const Group& group,
               const MountAllowlist& allowlist,
               MountMapping& out, std::string& reason) const;

    // Absolute paths that may never be mounted, in any form
    std::vector<std::string> sensitive_paths() const;

    // Built-in path component names treated as credential stores
    static const std::vector<std::string>& blocked_components();

    static bool valid_container_path(const std::string& path);

private:
    bool is_sensitive(const std::string& path, const MountAllowlist& allowlist,
                      std::string& matched) const;

    const Settings& settings_;
};

} // namespace nanoclaw

#endif // nanoclaw_CORE_MOUNT_SECURITY_HPP
