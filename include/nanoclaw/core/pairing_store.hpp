/*
 * nanoclaw C++ - Pairing Store
 *
 * Pending pairing codes for chats asking to be registered from another
 * channel. A chat gets a 6-digit code; an operator confirms it with
 * GroupRegistry::register_pairing(), which turns the pending entry into a
 * registration.
 *
 * Persisted between CLI runs as <data_dir>/pending_pairings.json:
 *   { "<code>": { "jid", "chatId", "chatTitle", "expiresAt" } }
 *
 * All times are Unix milliseconds supplied by the caller.
 */
#ifndef nanoclaw_CORE_PAIRING_STORE_HPP
#define nanoclaw_CORE_PAIRING_STORE_HPP

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <cstdint>

namespace nanoclaw {

struct PendingPairing {
    std::string code;
    std::string jid;
    int64_t chat_id;
    std::string chat_title;
    int64_t expires_at_ms;

    PendingPairing() : chat_id(0), expires_at_ms(0) {}
};

struct PendingSummary {
    std::string code;
    std::string chat_title;
    int64_t expires_in_minutes;

    PendingSummary() : expires_in_minutes(0) {}
};

class PairingStore {
public:
    static const int64_t DEFAULT_EXPIRY_MS = 60 * 60 * 1000;

    explicit PairingStore(int64_t expiry_ms = DEFAULT_EXPIRY_MS);

    // Existing live code for jid, or a fresh one
    std::string issue(const std::string& jid, int64_t chat_id,
                      const std::string& chat_title, int64_t now_ms);

    // Consumes a live code. False for unknown or expired codes.
    bool verify(const std::string& code, int64_t now_ms, PendingPairing& out);

    std::vector<PendingSummary> pending(int64_t now_ms);

    size_t size() const;

    // Missing file = nothing pending. Malformed entries are skipped.
    bool load(const std::string& path, std::string& error);
    bool save(const std::string& path, std::string& error) const;

    // Uniform 6-digit code, 100000..999999
    static std::string generate_code();

private:
    PairingStore(const PairingStore&);
    PairingStore& operator=(const PairingStore&);

    void purge_expired(int64_t now_ms);

    int64_t expiry_ms_;
    mutable std::mutex mutex_;
    std::map<std::string, PendingPairing> pending_;  // by code
};

} // namespace nanoclaw

#endif // nanoclaw_CORE_PAIRING_STORE_HPP
