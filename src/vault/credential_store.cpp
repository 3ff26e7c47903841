#include "vault/credential_store.hpp"
#include "core/utils.hpp"
#include "security/connection_identity.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <stdexcept>

namespace credvault {

namespace {

constexpr const char* kNotFound = "Credential not found";

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

CredentialStore::CredentialStore(std::shared_ptr<ICredentialRepository> repository,
                                 std::shared_ptr<CredentialCipher> cipher,
                                 std::shared_ptr<AuditLog> audit_log,
                                 Config config)
    : repository_(std::move(repository)),
      cipher_(std::move(cipher)),
      audit_log_(std::move(audit_log)),
      config_(std::move(config)),
      locks_(config_.lock_stripes) {
    if (!repository_ || !cipher_ || !audit_log_) {
        throw std::invalid_argument(
            "CredentialStore requires a repository, a cipher and an audit log");
    }
}

CredentialStore::CredentialStore(std::shared_ptr<ICredentialRepository> repository,
                                 std::shared_ptr<CredentialCipher> cipher,
                                 std::shared_ptr<AuditLog> audit_log)
    : CredentialStore(std::move(repository), std::move(cipher), std::move(audit_log), Config{}) {}

// ============================================================================
// save
// ============================================================================

SaveResult CredentialStore::save(const SaveRequest& request, const RequestContext& ctx) {
    std::string hash;
    try {
        hash = ConnectionIdentity::fingerprint(request.host, request.port, request.database,
                                               request.username, request.engine_type);
    } catch (const std::exception& e) {
        return save_failed(AuditOperation::CREATE, "", std::nullopt,
                           std::format("Failed to save credentials: {}", e.what()), ctx);
    }

    if (const auto problem = validate(request)) {
        return save_failed(AuditOperation::CREATE, hash, std::nullopt, *problem, ctx);
    }

    std::string name = utils::trim(request.name);
    if (name.empty()) {
        name = std::format("{}://{}@{}:{}/{}", request.engine_type, request.username,
                           request.host, request.port, request.database);
    }

    std::lock_guard<std::mutex> lock(locks_.lock_for(hash));
    return save_locked(request, name, hash, ctx);
}

SaveResult CredentialStore::save_locked(const SaveRequest& request, const std::string& name,
                                        const std::string& hash, const RequestContext& ctx) {
    AuditOperation op = AuditOperation::CREATE;
    std::optional<int64_t> credential_id;

    try {
        auto row = repository_->find_by_hash(hash);
        if (row && row->is_active) {
            return report_duplicate(std::move(*row), ctx);
        }

        const auto encrypted = cipher_->encrypt(request.secret);
        const auto now = utils::now();
        std::map<std::string, std::string> metadata{
            {"name", name}, {"engine_type", request.engine_type}};

        if (row) {
            op = AuditOperation::UPDATE;
            credential_id = row->id;

            Credential revived = std::move(*row);
            revived.name = name;
            revived.encrypted_secret = encrypted.ciphertext;
            revived.encryption_salt = encrypted.salt;
            revived.owner_session = ctx.owner_session;
            revived.updated_at = now;
            revived.last_used = now;
            revived.is_active = true;

            if (!repository_->reactivate(revived)) {
                // Reactivated by another writer between our read and write
                if (auto current = repository_->find_active_by_hash(hash)) {
                    return report_duplicate(std::move(*current), ctx);
                }
                return save_failed(op, hash, credential_id,
                    "Failed to save credentials: credential changed concurrently", ctx);
            }

            utils::log::info(std::format("Credential reactivated: id={} name='{}' engine={} hash={}",
                revived.id, revived.name, revived.engine_type, utils::short_hash(hash)));
            audit(op, true, ctx, hash, revived.id, std::nullopt, std::move(metadata));
            return SaveResult{SaveStatus::REACTIVATED, std::move(revived), false,
                              "Credentials reactivated successfully"};
        }

        Credential fresh;
        fresh.connection_hash = hash;
        fresh.name = name;
        fresh.host = request.host;
        fresh.port = request.port;
        fresh.database = request.database;
        fresh.username = request.username;
        fresh.engine_type = request.engine_type;
        fresh.encrypted_secret = encrypted.ciphertext;
        fresh.encryption_salt = encrypted.salt;
        fresh.created_at = now;
        fresh.updated_at = now;
        fresh.last_used = now;
        fresh.owner_session = ctx.owner_session;
        fresh.is_active = true;

        Credential stored;
        try {
            stored = repository_->insert(fresh);
        } catch (const UniqueViolation&) {
            // Lost the insert race to a writer outside this process
            auto current = repository_->find_by_hash(hash);
            if (current && current->is_active) {
                return report_duplicate(std::move(*current), ctx);
            }
            throw;
        }

        utils::log::info(std::format("Credential created: id={} name='{}' engine={} hash={}",
            stored.id, stored.name, stored.engine_type, utils::short_hash(hash)));
        audit(op, true, ctx, hash, stored.id, std::nullopt, std::move(metadata));
        return SaveResult{SaveStatus::CREATED, std::move(stored), false,
                          "Credentials saved successfully"};

    } catch (const CipherError& e) {
        return save_failed(op, hash, credential_id,
                           std::format("Failed to save credentials: encryption failed: {}", e.what()), ctx);
    } catch (const std::exception& e) {
        return save_failed(op, hash, credential_id,
                           std::format("Failed to save credentials: {}", e.what()), ctx);
    }
}

SaveResult CredentialStore::report_duplicate(Credential existing, const RequestContext& ctx) {
    const std::string hash = existing.connection_hash;
    try {
        const auto now = utils::now();
        if (repository_->touch(existing.id, now)) {
            existing.last_used = now;
        }
    } catch (const std::exception& e) {
        return save_failed(AuditOperation::DUPLICATE_CHECK, hash, existing.id,
                           std::format("Failed to save credentials: {}", e.what()), ctx);
    }

    utils::log::debug(std::format("Credential already stored: id={} hash={}",
        existing.id, utils::short_hash(hash)));
    audit(AuditOperation::DUPLICATE_CHECK, true, ctx, hash, existing.id, std::nullopt,
          {{"action", "found_existing"}});
    return SaveResult{SaveStatus::EXISTS, std::move(existing), true,
                      "Credentials already exist for this connection"};
}

SaveResult CredentialStore::save_failed(AuditOperation op, const std::string& hash,
                                        std::optional<int64_t> credential_id,
                                        const std::string& message, const RequestContext& ctx) {
    utils::log::warn(std::format("Credential save failed (hash={}): {}",
        utils::short_hash(hash), message));
    audit(op, false, ctx, hash, credential_id, message);

    SaveResult result;
    result.status = SaveStatus::ERROR;
    result.message = message;
    return result;
}

std::optional<std::string> CredentialStore::validate(const SaveRequest& request) const {
    if (!utils::in_range<1, 65535>(request.port)) {
        return std::format("Invalid port {}: must be between 1 and 65535", request.port);
    }
    if (!engine_allowed(request.engine_type)) {
        return std::format("Unsupported database type '{}'", request.engine_type);
    }
    return std::nullopt;
}

bool CredentialStore::engine_allowed(const std::string& engine_type) const {
    return std::find(config_.allowed_engines.begin(), config_.allowed_engines.end(),
                     engine_type) != config_.allowed_engines.end();
}

// ============================================================================
// get / get_secret
// ============================================================================

CredentialStore::LoadedCredential CredentialStore::load_visible(
    int64_t id, const std::optional<std::string>& session) {
    try {
        auto row = repository_->find_by_id(id);
        if (!row || !row->is_active || !row->visible_to(session)) {
            return {std::nullopt, ""};
        }
        return {std::move(row), ""};
    } catch (const std::exception& e) {
        return {std::nullopt, std::format("Failed to load credential: {}", e.what())};
    }
}

Result<Credential> CredentialStore::get(int64_t id, const RequestContext& ctx) {
    auto loaded = load_visible(id, ctx.owner_session);
    if (!loaded.error.empty()) {
        utils::log::warn(std::format("Credential {} lookup failed: {}", id, loaded.error));
        audit(AuditOperation::ACCESS, false, ctx, "", id, loaded.error);
        return Result<Credential>::error(ErrorCategory::PERSISTENCE_ERROR, loaded.error);
    }
    if (!loaded.credential) {
        audit(AuditOperation::ACCESS, false, ctx, "", id, std::string(kNotFound));
        return Result<Credential>::error(ErrorCategory::NOT_FOUND, kNotFound);
    }

    Credential credential = std::move(*loaded.credential);
    try {
        const auto now = utils::now();
        if (repository_->touch(credential.id, now)) {
            credential.last_used = now;
        }
    } catch (const std::exception& e) {
        const auto message = std::format("Failed to update last_used: {}", e.what());
        audit(AuditOperation::ACCESS, false, ctx, credential.connection_hash, id, message);
        return Result<Credential>::error(ErrorCategory::PERSISTENCE_ERROR, message);
    }

    audit(AuditOperation::ACCESS, true, ctx, credential.connection_hash, id);
    return Result<Credential>::ok(std::move(credential));
}

Result<std::string> CredentialStore::get_secret(int64_t id, const RequestContext& ctx) {
    auto loaded = load_visible(id, ctx.owner_session);
    if (!loaded.error.empty()) {
        utils::log::warn(std::format("Credential {} lookup failed: {}", id, loaded.error));
        audit(AuditOperation::DECRYPT, false, ctx, "", id, loaded.error);
        return Result<std::string>::error(ErrorCategory::PERSISTENCE_ERROR, loaded.error);
    }
    if (!loaded.credential) {
        audit(AuditOperation::DECRYPT, false, ctx, "", id, std::string(kNotFound));
        return Result<std::string>::error(ErrorCategory::NOT_FOUND, kNotFound);
    }

    const Credential& credential = *loaded.credential;
    std::string secret;
    try {
        secret = cipher_->decrypt(credential.encrypted_secret, credential.encryption_salt);
    } catch (const DecryptionError& e) {
        utils::log::warn(std::format("Credential {} could not be decrypted (hash={})",
            id, utils::short_hash(credential.connection_hash)));
        audit(AuditOperation::DECRYPT, false, ctx, credential.connection_hash, id,
              std::string(e.what()));
        return Result<std::string>::error(ErrorCategory::DECRYPTION_ERROR, e.what());
    } catch (const std::exception& e) {
        audit(AuditOperation::DECRYPT, false, ctx, credential.connection_hash, id,
              std::string(e.what()));
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR, e.what());
    }

    try {
        repository_->touch(credential.id, utils::now());
    } catch (const std::exception& e) {
        const auto message = std::format("Failed to update last_used: {}", e.what());
        audit(AuditOperation::DECRYPT, false, ctx, credential.connection_hash, id, message);
        return Result<std::string>::error(ErrorCategory::PERSISTENCE_ERROR, message);
    }

    audit(AuditOperation::DECRYPT, true, ctx, credential.connection_hash, id);
    return Result<std::string>::ok(std::move(secret));
}

// ============================================================================
// list / remove / lookups
// ============================================================================

Result<std::vector<Credential>> CredentialStore::list(const std::optional<std::string>& owner_session) {
    try {
        return Result<std::vector<Credential>>::ok(repository_->list_active(owner_session));
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Credential listing failed: {}", e.what()));
        return Result<std::vector<Credential>>::error(ErrorCategory::PERSISTENCE_ERROR,
            std::format("Failed to list credentials: {}", e.what()));
    }
}

Result<bool> CredentialStore::remove(int64_t id, const RequestContext& ctx) {
    std::optional<Credential> row;
    try {
        row = repository_->find_by_id(id);
    } catch (const std::exception& e) {
        const auto message = std::format("Failed to delete credential: {}", e.what());
        audit(AuditOperation::DELETE, false, ctx, "", id, message);
        return Result<bool>::error(ErrorCategory::PERSISTENCE_ERROR, message);
    }

    if (!row || !row->is_active) {
        audit(AuditOperation::DELETE, false, ctx, "", id, std::string(kNotFound));
        return Result<bool>::ok(false);
    }

    if (config_.delete_scope == DeleteScope::OWNER_ONLY && !row->visible_to(ctx.owner_session)) {
        audit(AuditOperation::DELETE, false, ctx, row->connection_hash, id,
              std::string("Credential belongs to another session"));
        return Result<bool>::ok(false);
    }

    bool deleted = false;
    try {
        deleted = repository_->soft_delete(id, utils::now());
    } catch (const std::exception& e) {
        const auto message = std::format("Failed to delete credential: {}", e.what());
        utils::log::warn(std::format("Credential {} delete failed: {}", id, e.what()));
        audit(AuditOperation::DELETE, false, ctx, row->connection_hash, id, message);
        return Result<bool>::error(ErrorCategory::PERSISTENCE_ERROR, message);
    }

    if (!deleted) {
        audit(AuditOperation::DELETE, false, ctx, row->connection_hash, id, std::string(kNotFound));
        return Result<bool>::ok(false);
    }

    utils::log::info(std::format("Credential deleted: id={} name='{}' hash={}",
        id, row->name, utils::short_hash(row->connection_hash)));
    audit(AuditOperation::DELETE, true, ctx, row->connection_hash, id);
    return Result<bool>::ok(true);
}

Result<std::optional<Credential>> CredentialStore::check_duplicate(
    const ConnectionIdentityFields& identity) {
    std::string hash;
    try {
        hash = ConnectionIdentity::fingerprint(identity);
    } catch (const std::exception& e) {
        return Result<std::optional<Credential>>::error(ErrorCategory::INTERNAL_ERROR, e.what());
    }
    return find_active_by_hash(hash);
}

Result<std::optional<Credential>> CredentialStore::find_active_by_hash(
    const std::string& connection_hash) {
    try {
        return Result<std::optional<Credential>>::ok(
            repository_->find_active_by_hash(connection_hash));
    } catch (const std::exception& e) {
        return Result<std::optional<Credential>>::error(ErrorCategory::PERSISTENCE_ERROR,
            std::format("Failed to look up credential: {}", e.what()));
    }
}

Result<bool> CredentialStore::touch(int64_t id) {
    try {
        return Result<bool>::ok(repository_->touch(id, utils::now()));
    } catch (const std::exception& e) {
        return Result<bool>::error(ErrorCategory::PERSISTENCE_ERROR,
            std::format("Failed to update last_used: {}", e.what()));
    }
}

Result<std::vector<AuditEntry>> CredentialStore::audit_trail(std::optional<int64_t> credential_id,
                                                             std::optional<size_t> limit) {
    try {
        return Result<std::vector<AuditEntry>>::ok(audit_log_->list(credential_id, limit));
    } catch (const std::exception& e) {
        return Result<std::vector<AuditEntry>>::error(ErrorCategory::PERSISTENCE_ERROR,
            std::format("Failed to read audit trail: {}", e.what()));
    }
}

// ============================================================================
// Audit
// ============================================================================

void CredentialStore::audit(AuditOperation op, bool success, const RequestContext& ctx,
                            const std::string& hash, std::optional<int64_t> credential_id,
                            std::optional<std::string> error_message,
                            std::map<std::string, std::string> metadata) {
    AuditEntry entry;
    entry.credential_id = credential_id;
    entry.connection_hash = hash;
    entry.operation = op;
    entry.success = success;
    entry.error_message = std::move(error_message);
    entry.owner_session = ctx.owner_session;
    entry.ip_address = ctx.ip_address;
    entry.user_agent = ctx.user_agent;
    entry.timestamp = utils::now();
    entry.metadata = std::move(metadata);
    audit_log_->record(std::move(entry));
}

} // namespace credvault
