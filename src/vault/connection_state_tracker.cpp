#include "vault/connection_state_tracker.hpp"

#include <algorithm>

namespace credvault {

void ConnectionStateTracker::mark_connected(const std::string& connection_hash) {
    if (connection_hash.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    connected_.insert(connection_hash);
}

void ConnectionStateTracker::clear(const std::string& connection_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_.erase(connection_hash);
}

void ConnectionStateTracker::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_.clear();
}

void ConnectionStateTracker::replace_all(const std::string& connection_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_.clear();
    if (!connection_hash.empty()) {
        connected_.insert(connection_hash);
    }
}

bool ConnectionStateTracker::is_connected(const std::string& connection_hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_.contains(connection_hash);
}

std::vector<std::string> ConnectionStateTracker::snapshot() const {
    std::vector<std::string> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.assign(connected_.begin(), connected_.end());
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t ConnectionStateTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_.size();
}

} // namespace credvault
