#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace credvault {

/**
 * @brief Process-lifetime set of connection hashes considered connected
 *
 * Never persisted: a new process starts empty. Only the connection
 * lifecycle caller changes it; saving or deleting a credential does not.
 * All operations are serialized on one mutex.
 */
class ConnectionStateTracker {
public:
    ConnectionStateTracker() = default;

    ConnectionStateTracker(const ConnectionStateTracker&) = delete;
    ConnectionStateTracker& operator=(const ConnectionStateTracker&) = delete;

    /// Empty hashes are ignored
    void mark_connected(const std::string& connection_hash);
    void clear(const std::string& connection_hash);
    void clear_all();

    /// Clears the set and marks one hash, under a single lock
    void replace_all(const std::string& connection_hash);

    [[nodiscard]] bool is_connected(const std::string& connection_hash) const;

    /// Copy of the current set, sorted
    [[nodiscard]] std::vector<std::string> snapshot() const;
    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_set<std::string> connected_;
};

} // namespace credvault
