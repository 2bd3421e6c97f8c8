/*
 * nanoclaw C++ - Pairing Store Implementation
 */
#include <nanoclaw/core/pairing_store.hpp>
#include <nanoclaw/core/json.hpp>
#include <nanoclaw/core/logger.hpp>
#include <nanoclaw/core/utils.hpp>

#include <openssl/rand.h>
#include <random>

namespace nanoclaw {

PairingStore::PairingStore(int64_t expiry_ms)
    : expiry_ms_(expiry_ms) {}

std::string PairingStore::generate_code() {
    uint32_t value = 0;
    unsigned char bytes[4];
    // Rejection sampling keeps the distribution uniform over 900000 values
    const uint32_t limit = 0xFFFFFFFFu - (0xFFFFFFFFu % 900000u);
    for (;;) {
        if (RAND_bytes(bytes, sizeof(bytes)) == 1) {
            value = (static_cast<uint32_t>(bytes[0]) << 24) | (static_cast<uint32_t>(bytes[1]) << 16) |
                    (static_cast<uint32_t>(bytes[2]) << 8) | static_cast<uint32_t>(bytes[3]);
        } else {
            LOG_WARN("[PairingStore] RAND_bytes failed, using std::random_device");
            std::random_device rd;
            value = rd();
        }
        if (value < limit) break;
    }
    return std::to_string(100000u + value % 900000u);
}

void PairingStore::purge_expired(int64_t now_ms) {
    std::map<std::string, PendingPairing>::iterator it = pending_.begin();
    while (it != pending_.end()) {
        if (it->second.expires_at_ms < now_ms) {
            LOG_DEBUG("[PairingStore] Code for %s expired", it->second.jid.c_str());
            pending_.erase(it++);
        } else {
            ++it;
        }
    }
}

std::string PairingStore::issue(const std::string& jid, int64_t chat_id,
                                const std::string& chat_title, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_expired(now_ms);

    for (std::map<std::string, PendingPairing>::const_iterator it = pending_.begin(); it != pending_.end(); ++it) {
        if (it->second.jid == jid) {
            return it->first;
        }
    }

    std::string code;
    do {
        code = generate_code();
    } while (pending_.count(code));

    PendingPairing p;
    p.code = code;
    p.jid = jid;
    p.chat_id = chat_id;
    p.chat_title = chat_title;
    p.expires_at_ms = now_ms + expiry_ms_;
    pending_[code] = p;

    LOG_INFO("[PairingStore] Issued pairing code for %s (%s)", jid.c_str(), chat_title.c_str());
    return code;
}

bool PairingStore::verify(const std::string& code, int64_t now_ms, PendingPairing& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_expired(now_ms);

    std::map<std::string, PendingPairing>::iterator it = pending_.find(code);
    if (it == pending_.end()) {
        LOG_WARN("[PairingStore] Unknown or expired pairing code");
        return false;
    }
    out = it->second;
    pending_.erase(it);
    return true;
}

std::vector<PendingSummary> PairingStore::pending(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_expired(now_ms);

    std::vector<PendingSummary> out;
    for (std::map<std::string, PendingPairing>::const_iterator it = pending_.begin(); it != pending_.end(); ++it) {
        PendingSummary s;
        s.code = it->first;
        s.chat_title = it->second.chat_title;
        // Rounded to the nearest minute
        s.expires_in_minutes = (it->second.expires_at_ms - now_ms + 30000) / 60000;
        out.push_back(s);
    }
    return out;
}

size_t PairingStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool PairingStore::load(const std::string& path, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.clear();

    if (!path_exists(path)) {
        return true;
    }
    std::string content;
    if (!read_file(path, content)) {
        error = "cannot read " + path;
        return false;
    }

    Json doc;
    try {
        doc = Json::parse(content);
    } catch (const Json::exception& e) {
        error = "malformed " + path + ": " + e.what();
        return false;
    }
    if (!doc.is_object()) {
        error = path + ": expected an object keyed by code";
        return false;
    }

    for (Json::const_iterator it = doc.begin(); it != doc.end(); ++it) {
        const Json& e = it.value();
        if (!e.is_object() || !e.contains("jid") || !e["jid"].is_string() ||
            !e.contains("expiresAt") || !e["expiresAt"].is_number_integer()) {
            LOG_WARN("[PairingStore] Skipping malformed pending pairing %s", it.key().c_str());
            continue;
        }
        PendingPairing p;
        p.code = it.key();
        p.jid = e["jid"].get<std::string>();
        p.chat_id = e.value("chatId", static_cast<int64_t>(0));
        p.chat_title = e.value("chatTitle", std::string());
        p.expires_at_ms = e["expiresAt"].get<int64_t>();
        pending_[p.code] = p;
    }
    return true;
}

bool PairingStore::save(const std::string& path, std::string& error) const {
    Json doc = Json::object();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (std::map<std::string, PendingPairing>::const_iterator it = pending_.begin(); it != pending_.end(); ++it) {
            Json e;
            e["jid"] = it->second.jid;
            e["chatId"] = it->second.chat_id;
            e["chatTitle"] = it->second.chat_title;
            e["expiresAt"] = it->second.expires_at_ms;
            doc[it->first] = e;
        }
    }

    size_t slash = path.rfind('/');
    if (slash != std::string::npos && slash > 0 && !ensure_directory(path.substr(0, slash))) {
        error = "cannot create directory for " + path;
        return false;
    }
    if (!write_file_atomic(path, dump_json(doc, 2))) {
        error = "cannot write " + path;
        return false;
    }
    return true;
}

} // namespace nanoclaw
