#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace credvault {

/**
 * @brief Fixed set of mutexes striped by connection hash
 *
 * Two saves for the same hash always map to the same stripe, so the
 * read-then-write in save() is serialized per identity within a process.
 * Distinct hashes may share a stripe; that only costs parallelism.
 */
class HashLockTable {
public:
    explicit HashLockTable(size_t stripes = 64)
        : stripes_(stripes == 0 ? 1 : stripes) {}

    HashLockTable(const HashLockTable&) = delete;
    HashLockTable& operator=(const HashLockTable&) = delete;

    [[nodiscard]] std::mutex& lock_for(const std::string& connection_hash) {
        return stripes_[select_stripe(connection_hash)];
    }

    [[nodiscard]] size_t select_stripe(const std::string& connection_hash) const {
        return std::hash<std::string>{}(connection_hash) % stripes_.size();
    }

    [[nodiscard]] size_t stripe_count() const { return stripes_.size(); }

private:
    std::vector<std::mutex> stripes_;
};

} // namespace credvault
