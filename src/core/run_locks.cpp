/*
 * nanoclaw C++ - Per-group run locks
 */
#include <nanoclaw/core/run_locks.hpp>

namespace nanoclaw {

std::mutex& GroupRunLocks::mutex_for(const std::string& folder) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    std::unique_ptr<std::mutex>& slot = locks_[folder];
    if (!slot) {
        slot.reset(new std::mutex());
    }
    return *slot;
}

std::unique_lock<std::mutex> GroupRunLocks::acquire(const std::string& folder) {
    return std::unique_lock<std::mutex>(mutex_for(folder));
}

std::unique_lock<std::mutex> GroupRunLocks::try_acquire(const std::string& folder) {
    return std::unique_lock<std::mutex>(mutex_for(folder), std::try_to_lock);
}

size_t GroupRunLocks::size() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return locks_.size();
}

} // namespace nanoclaw
