#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace credvault {

using Timestamp = std::chrono::system_clock::time_point;

// ============================================================================
// Connection identity
// ============================================================================

/**
 * @brief The five fields that identify a connection target
 *
 * Changing any of them changes the fingerprint and therefore the identity.
 */
struct ConnectionIdentityFields {
    std::string host;
    uint16_t port = 0;
    std::string database;
    std::string username;
    std::string engine_type;
};

// ============================================================================
// Credential
// ============================================================================

struct Credential {
    int64_t id = 0;
    std::string connection_hash;        // 64 hex chars (SHA-256)
    std::string name;

    std::string host;
    uint16_t port = 0;
    std::string database;
    std::string username;
    std::string engine_type;

    std::string encrypted_secret;       // base64(iv | ciphertext | tag)
    std::string encryption_salt;        // 32 hex chars

    Timestamp created_at{};
    Timestamp updated_at{};
    Timestamp last_used{};

    std::optional<std::string> owner_session;   // nullopt = global
    bool is_active = true;

    [[nodiscard]] ConnectionIdentityFields identity() const {
        return {host, port, database, username, engine_type};
    }

    /// Visible to a session when global, owned by it, or when the caller is unscoped
    [[nodiscard]] bool visible_to(const std::optional<std::string>& session) const {
        if (!session || !owner_session) return true;
        return *owner_session == *session;
    }
};

// ============================================================================
// Request context (passed opaquely by the route layer)
// ============================================================================

struct RequestContext {
    std::optional<std::string> owner_session;
    std::optional<std::string> ip_address;
    std::optional<std::string> user_agent;

    RequestContext() = default;
    explicit RequestContext(std::optional<std::string> session)
        : owner_session(std::move(session)) {}
};

// ============================================================================
// Save
// ============================================================================

struct SaveRequest {
    std::string name;
    std::string host;
    uint16_t port = 0;
    std::string database;
    std::string username;
    std::string secret;
    std::string engine_type;
};

enum class SaveStatus {
    CREATED,
    REACTIVATED,
    EXISTS,
    ERROR
};

[[nodiscard]] inline const char* save_status_to_string(SaveStatus status) {
    switch (status) {
        case SaveStatus::CREATED:     return "created";
        case SaveStatus::REACTIVATED: return "reactivated";
        case SaveStatus::EXISTS:      return "exists";
        case SaveStatus::ERROR:       return "error";
    }
    return "unknown";
}

struct SaveResult {
    SaveStatus status = SaveStatus::ERROR;
    std::optional<Credential> credential;
    bool is_duplicate = false;
    std::string message;
};

// ============================================================================
// Delete scope policy
// ============================================================================

enum class DeleteScope {
    ANY_SESSION,    // any caller may delete any id
    OWNER_ONLY      // only the owning session (or anyone, for global rows)
};

// ============================================================================
// Connection view (credential + live status)
// ============================================================================

struct ConnectionView {
    Credential credential;
    bool connected = false;
    std::optional<std::string> secret;  // only set by connection_with_secret
};

} // namespace credvault
