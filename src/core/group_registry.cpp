/*
 * nanoclaw C++ - Group Registry Implementation
 */
#include <nanoclaw/core/group_registry.hpp>
#include <nanoclaw/core/logger.hpp>
#include <nanoclaw/core/utils.hpp>

#include <cctype>

namespace nanoclaw {

GroupRegistry::GroupRegistry(const Settings& settings)
    : settings_(settings) {}

std::string GroupRegistry::path() const {
    return join_path(settings_.data_dir, "registered_groups.json");
}

Group GroupRegistry::with_role(const Group& group) const {
    Group g = group;
    g.is_main = (g.folder == settings_.main_group_folder);
    return g;
}

bool GroupRegistry::load(std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    groups_.clear();

    if (!path_exists(path())) {
        LOG_INFO("[GroupRegistry] No registry at %s", path().c_str());
        return true;
    }

    std::string content;
    if (!read_file(path(), content)) {
        error = "cannot read " + path();
        return false;
    }

    Json doc;
    try {
        doc = Json::parse(content);
    } catch (const Json::exception& e) {
        error = "malformed " + path() + ": " + e.what();
        return false;
    }
    if (!doc.is_object()) {
        error = path() + ": expected an object keyed by chat id";
        return false;
    }

    for (Json::const_iterator it = doc.begin(); it != doc.end(); ++it) {
        Group g;
        if (!parse_group(it.key(), it.value(), g)) {
            LOG_WARN("[GroupRegistry] Skipping malformed entry %s", it.key().c_str());
            continue;
        }
        if (!valid_folder(g.folder)) {
            LOG_WARN("[GroupRegistry] Skipping %s: invalid folder '%s'", it.key().c_str(), g.folder.c_str());
            continue;
        }
        groups_[g.jid] = with_role(g);
    }

    LOG_INFO("[GroupRegistry] Loaded %zu group(s)", groups_.size());
    return true;
}

bool GroupRegistry::save(std::string& error) const {
    Json doc = Json::object();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (std::map<std::string, Group>::const_iterator it = groups_.begin(); it != groups_.end(); ++it) {
            doc[it->first] = to_json(it->second);
        }
    }

    if (!ensure_directory(settings_.data_dir)) {
        error = "cannot create " + settings_.data_dir;
        return false;
    }
    if (!write_file_atomic(path(), dump_json(doc, 2))) {
        error = "cannot write " + path();
        return false;
    }
    return true;
}

bool GroupRegistry::find_by_folder(const std::string& folder, Group& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::map<std::string, Group>::const_iterator it = groups_.begin(); it != groups_.end(); ++it) {
        if (it->second.folder == folder) {
            out = it->second;
            return true;
        }
    }
    return false;
}

bool GroupRegistry::find_by_jid(const std::string& jid, Group& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, Group>::const_iterator it = groups_.find(jid);
    if (it == groups_.end()) return false;
    out = it->second;
    return true;
}

std::vector<Group> GroupRegistry::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Group> out;
    for (std::map<std::string, Group>::const_iterator it = groups_.begin(); it != groups_.end(); ++it) {
        out.push_back(it->second);
    }
    return out;
}

std::vector<std::string> GroupRegistry::jids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (std::map<std::string, Group>::const_iterator it = groups_.begin(); it != groups_.end(); ++it) {
        out.push_back(it->first);
    }
    return out;
}

bool GroupRegistry::register_group(const Group& group, std::string& error) {
    if (group.jid.empty()) {
        error = "missing chat id";
        return false;
    }
    if (!valid_folder(group.folder)) {
        error = "invalid folder name '" + group.folder + "'";
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (groups_.count(group.jid)) {
            error = group.jid + " is already registered";
            return false;
        }
        for (std::map<std::string, Group>::const_iterator it = groups_.begin(); it != groups_.end(); ++it) {
            if (it->second.folder == group.folder) {
                error = "folder '" + group.folder + "' is already used by " + it->first;
                return false;
            }
        }
        Group g = with_role(group);
        if (g.added_at.empty()) {
            g.added_at = format_timestamp_utc(current_timestamp_ms());
        }
        groups_[g.jid] = g;
    }

    bool stored = ensure_directory(settings_.logs_dir(group.folder));
    if (!stored) {
        error = "cannot create group directory for " + group.folder;
    } else {
        stored = save(error);
    }
    if (!stored) {
        // Not persisted, so not registered
        std::lock_guard<std::mutex> lock(mutex_);
        groups_.erase(group.jid);
        LOG_ERROR("[GroupRegistry] Registration of %s failed: %s", group.jid.c_str(), error.c_str());
        return false;
    }
    LOG_INFO("[GroupRegistry] Registered %s as '%s' (folder %s)",
             group.jid.c_str(), group.name.c_str(), group.folder.c_str());
    return true;
}

bool GroupRegistry::register_pairing(PairingStore& pairings, const std::string& code,
                                     const std::string& trigger, int64_t now_ms,
                                     Group& out, std::string& error) {
    PendingPairing pairing;
    if (!pairings.verify(trim(code), now_ms, pairing)) {
        error = "unknown or expired pairing code";
        return false;
    }

    Group existing;
    if (find_by_jid(pairing.jid, existing)) {
        error = pairing.jid + " is already registered";
        return false;
    }

    Group group;
    group.jid = pairing.jid;
    group.name = pairing.chat_title;
    group.folder = registration_folder_for(pairing.chat_title);
    group.trigger = trigger;
    if (!register_group(group, error)) {
        return false;
    }

    find_by_jid(group.jid, out);
    LOG_INFO("[GroupRegistry] %s paired into folder %s", pairing.jid.c_str(), group.folder.c_str());
    return true;
}

bool GroupRegistry::valid_folder(const std::string& folder) {
    if (folder.empty() || folder == "global" || folder.size() > 64) return false;
    if (!std::islower(static_cast<unsigned char>(folder[0])) &&
        !std::isdigit(static_cast<unsigned char>(folder[0]))) {
        return false;
    }
    for (size_t i = 0; i < folder.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(folder[i]);
        if (!std::islower(c) && !std::isdigit(c) && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

std::string GroupRegistry::registration_folder_for(const std::string& title) {
    std::string slug;
    for (size_t i = 0; i < title.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(title[i])));
        if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
            slug.push_back(static_cast<char>(c));
        } else if (slug.empty() || slug[slug.size() - 1] != '-') {
            slug.push_back('-');
        }
    }
    return "tg-" + slug.substr(0, 20);
}

} // namespace nanoclaw
