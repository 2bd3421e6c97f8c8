/*
 * nanoclaw C++ - Per-tenant run serialization
 *
 * One mutex per tenant folder, created on first use and kept for the life
 * of the process. Jobs for the same tenant queue up; different tenants
 * never contend.
 */
#ifndef nanoclaw_CORE_RUN_LOCKS_HPP
#define nanoclaw_CORE_RUN_LOCKS_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace nanoclaw {

class GroupRunLocks {
public:
    GroupRunLocks() {}

    // Blocks until the tenant's lock is held
    std::unique_lock<std::mutex> acquire(const std::string& folder);

    // Non-blocking; the returned lock owns nothing if the tenant is busy
    std::unique_lock<std::mutex> try_acquire(const std::string& folder);

    size_t size() const;

private:
    GroupRunLocks(const GroupRunLocks&);
    GroupRunLocks& operator=(const GroupRunLocks&);

    std::mutex& mutex_for(const std::string& folder);

    mutable std::mutex map_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex> > locks_;
};

} // namespace nanoclaw

#endif // nanoclaw_CORE_RUN_LOCKS_HPP
