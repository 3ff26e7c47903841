#pragma once

#include "config/config_types.hpp"

#include <memory>

namespace credvault {

class IMasterKeyProvider;
class CredentialCipher;
class ConnectionPool;
class ICredentialRepository;
class IAuditRepository;
class AuditLog;
class CredentialStore;
class ConnectionStateTracker;
class ConnectionRegistry;

/**
 * @brief Every long-lived vault component, wired together
 *
 * Owned by the application context; nothing here is a global.
 */
struct VaultContext {
    std::shared_ptr<IMasterKeyProvider> key_provider;
    std::shared_ptr<CredentialCipher> cipher;
    std::shared_ptr<ConnectionPool> pool;               // nullptr for the memory backend
    std::shared_ptr<ICredentialRepository> credentials;
    std::shared_ptr<IAuditRepository> audit_repository;
    std::shared_ptr<AuditLog> audit_log;
    std::shared_ptr<CredentialStore> store;
    std::shared_ptr<ConnectionStateTracker> tracker;
    std::shared_ptr<ConnectionRegistry> registry;
};

/**
 * @brief Builds a VaultContext from configuration
 *
 * Components not supplied explicitly are created from the config.
 *
 * Usage:
 *   auto vault = VaultBuilder(config)
 *       .with_master_key_provider(provider)    // optional
 *       .build();
 */
class VaultBuilder {
public:
    explicit VaultBuilder(VaultConfig config) : config_(std::move(config)) {}

    VaultBuilder& with_master_key_provider(std::shared_ptr<IMasterKeyProvider> p) { key_provider_ = std::move(p); return *this; }
    VaultBuilder& with_credential_repository(std::shared_ptr<ICredentialRepository> p) { credentials_ = std::move(p); return *this; }
    VaultBuilder& with_audit_repository(std::shared_ptr<IAuditRepository> p) { audit_repository_ = std::move(p); return *this; }

    /**
     * @brief Build and wire every component
     * @throws std::invalid_argument if the master key is missing or the config is inconsistent
     * @throws std::runtime_error / PersistenceError if storage cannot be reached
     */
    [[nodiscard]] VaultContext build();

private:
    std::shared_ptr<IMasterKeyProvider> make_key_provider() const;
    void make_storage(VaultContext& ctx);

    VaultConfig config_;
    std::shared_ptr<IMasterKeyProvider> key_provider_;
    std::shared_ptr<ICredentialRepository> credentials_;
    std::shared_ptr<IAuditRepository> audit_repository_;
};

} // namespace credvault
