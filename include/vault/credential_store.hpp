#pragma once

#include "audit/audit_log.hpp"
#include "core/engine_type.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "db/icredential_repository.hpp"
#include "security/credential_cipher.hpp"
#include "vault/hash_lock_table.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace credvault {

/**
 * @brief Deduplicating, encrypting, audited store of connection credentials
 *
 * Every save/get/get_secret/remove call appends exactly one audit entry,
 * whether it succeeds or fails. list, check_duplicate and find_active_by_hash
 * are plain reads and are not audited.
 *
 * Failures are returned as Result / SaveResult values; no exception escapes
 * a public operation.
 */
class CredentialStore {
public:
    struct Config {
        std::vector<std::string> allowed_engines = default_allowed_engines();
        DeleteScope delete_scope = DeleteScope::ANY_SESSION;
        size_t lock_stripes = 64;
    };

    CredentialStore(std::shared_ptr<ICredentialRepository> repository,
                    std::shared_ptr<CredentialCipher> cipher,
                    std::shared_ptr<AuditLog> audit_log,
                    Config config);

    CredentialStore(std::shared_ptr<ICredentialRepository> repository,
                    std::shared_ptr<CredentialCipher> cipher,
                    std::shared_ptr<AuditLog> audit_log);

    /**
     * @brief Store a credential, or report the existing one
     *
     * created:     no row existed for the identity.
     * reactivated: a soft-deleted row was brought back with the new secret.
     * exists:      an active row exists; its last_used is refreshed and the
     *              supplied secret is discarded.
     * error:       validation, encryption or persistence failure.
     */
    [[nodiscard]] SaveResult save(const SaveRequest& request,
                                  const RequestContext& ctx = RequestContext{});

    /// Active credential visible to ctx.owner_session. Refreshes last_used.
    [[nodiscard]] Result<Credential> get(int64_t id,
                                         const RequestContext& ctx = RequestContext{});

    /**
     * @brief Decrypted secret of a visible active credential
     *
     * Audited once, as a decrypt entry. A decryption failure surfaces as
     * DECRYPTION_ERROR.
     */
    [[nodiscard]] Result<std::string> get_secret(int64_t id,
                                                 const RequestContext& ctx = RequestContext{});

    /// Active credentials visible to the session, most recently used first
    [[nodiscard]] Result<std::vector<Credential>> list(
        const std::optional<std::string>& owner_session = std::nullopt);

    /**
     * @brief Soft delete
     * @return false when no active row with that id exists, or when the
     *         delete scope is OWNER_ONLY and the row belongs to another session
     */
    [[nodiscard]] Result<bool> remove(int64_t id,
                                      const RequestContext& ctx = RequestContext{});

    /// Active credential for the identity, if any. No audit, no mutation.
    [[nodiscard]] Result<std::optional<Credential>> check_duplicate(
        const ConnectionIdentityFields& identity);

    [[nodiscard]] Result<std::optional<Credential>> find_active_by_hash(
        const std::string& connection_hash);

    /// Refresh last_used without auditing (connect events)
    [[nodiscard]] Result<bool> touch(int64_t id);

    [[nodiscard]] Result<std::vector<AuditEntry>> audit_trail(
        std::optional<int64_t> credential_id = std::nullopt,
        std::optional<size_t> limit = std::nullopt);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    struct LoadedCredential {
        std::optional<Credential> credential;
        std::string error;      // empty when the lookup itself succeeded
    };

    [[nodiscard]] std::optional<std::string> validate(const SaveRequest& request) const;
    [[nodiscard]] bool engine_allowed(const std::string& engine_type) const;

    SaveResult save_locked(const SaveRequest& request, const std::string& name,
                           const std::string& hash, const RequestContext& ctx);
    SaveResult report_duplicate(Credential existing, const RequestContext& ctx);
    SaveResult save_failed(AuditOperation op, const std::string& hash,
                           std::optional<int64_t> credential_id,
                           const std::string& message, const RequestContext& ctx);

    /// Visible active row by id, or the lookup error
    LoadedCredential load_visible(int64_t id, const std::optional<std::string>& session);

    void audit(AuditOperation op, bool success, const RequestContext& ctx,
               const std::string& hash, std::optional<int64_t> credential_id,
               std::optional<std::string> error_message = std::nullopt,
               std::map<std::string, std::string> metadata = {});

    std::shared_ptr<ICredentialRepository> repository_;
    std::shared_ptr<CredentialCipher> cipher_;
    std::shared_ptr<AuditLog> audit_log_;
    Config config_;
    HashLockTable locks_;
};

} // namespace credvault
