#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace credvault {

class CredentialStore;
class ConnectionStateTracker;

/**
 * @brief Connection lifecycle hooks and the client-facing connection view
 *
 * Bridges the (external) connect/disconnect handler to the state tracker,
 * and joins stored credentials with their live status.
 */
class ConnectionRegistry {
public:
    struct Config {
        /// A new connection supersedes every previously tracked one
        bool single_active_connection = true;
    };

    ConnectionRegistry(std::shared_ptr<CredentialStore> store,
                       std::shared_ptr<ConnectionStateTracker> tracker,
                       Config config);

    ConnectionRegistry(std::shared_ptr<CredentialStore> store,
                       std::shared_ptr<ConnectionStateTracker> tracker);

    /**
     * @brief Record a successful connect
     *
     * Looks up the active credential for the identity. When one exists it is
     * marked connected and its last_used refreshed; otherwise the tracker is
     * left untouched and nullopt is returned.
     */
    [[nodiscard]] Result<std::optional<Credential>> on_connected(
        const ConnectionIdentityFields& identity);

    /// Global disconnect: clears every tracked hash
    void on_disconnected();

    void on_disconnected(const std::string& connection_hash);

    /// Visible active credentials with their connected flag, most recently used first
    [[nodiscard]] Result<std::vector<ConnectionView>> connections(
        const std::optional<std::string>& owner_session = std::nullopt);

    /// Connection view with the decrypted secret attached (audited as access + decrypt)
    [[nodiscard]] Result<ConnectionView> connection_with_secret(
        int64_t id, const RequestContext& ctx = RequestContext{});

private:
    std::shared_ptr<CredentialStore> store_;
    std::shared_ptr<ConnectionStateTracker> tracker_;
    Config config_;
};

} // namespace credvault
