/*
 * nanoclaw C++ - Group Registry
 *
 * Registered tenants, persisted as <data_dir>/registered_groups.json:
 *   { "<jid>": { "name", "folder", "trigger", "added_at", "containerConfig" } }
 *
 * The privileged flag is not stored; a group is main iff its folder is the
 * configured main folder.
 */
#ifndef nanoclaw_CORE_GROUP_REGISTRY_HPP
#define nanoclaw_CORE_GROUP_REGISTRY_HPP

#include "types.hpp"
#include "settings.hpp"
#include "pairing_store.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace nanoclaw {

class GroupRegistry {
public:
    explicit GroupRegistry(const Settings& settings);

    std::string path() const;

    // Missing file = no groups. Malformed file fails and keeps nothing.
    bool load(std::string& error);
    bool save(std::string& error) const;

    bool find_by_folder(const std::string& folder, Group& out) const;
    bool find_by_jid(const std::string& jid, Group& out) const;
    std::vector<Group> all() const;
    std::vector<std::string> jids() const;

    // Adds and persists. Fails on a bad folder name, a folder already in use,
    // or a JID already registered.
    bool register_group(const Group& group, std::string& error);

    // Consumes a pairing code and registers its chat under
    // registration_folder_for(chat title). A consumed code whose chat is
    // already registered is refused.
    bool register_pairing(PairingStore& pairings, const std::string& code,
                          const std::string& trigger, int64_t now_ms,
                          Group& out, std::string& error);

    static bool valid_folder(const std::string& folder);

    // "tg-" + lowercase slug of title, non-alphanumeric runs -> '-', <= 20 chars
    static std::string registration_folder_for(const std::string& title);

private:
    Group with_role(const Group& group) const;

    const Settings& settings_;
    mutable std::mutex mutex_;
    std::map<std::string, Group> groups_;  // by jid
};

} // namespace nanoclaw

#endif // nanoclaw_CORE_GROUP_REGISTRY_HPP
