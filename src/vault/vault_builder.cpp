#include "vault/vault_builder.hpp"
#include "audit/audit_log.hpp"
#include "audit/file_sink.hpp"
#include "core/utils.hpp"
#include "db/connection_pool.hpp"
#include "db/memory/memory_audit_repository.hpp"
#include "db/memory/memory_credential_repository.hpp"
#include "db/postgresql/pg_audit_repository.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_credential_repository.hpp"
#include "db/postgresql/pg_schema.hpp"
#include "security/credential_cipher.hpp"
#include "security/env_master_key_provider.hpp"
#include "security/file_master_key_provider.hpp"
#include "vault/connection_registry.hpp"
#include "vault/connection_state_tracker.hpp"
#include "vault/credential_store.hpp"

#include <format>
#include <stdexcept>

namespace credvault {

std::shared_ptr<IMasterKeyProvider> VaultBuilder::make_key_provider() const {
    const auto& mk = config_.vault.master_key;
    if (mk.provider == "env") {
        return std::make_shared<EnvMasterKeyProvider>(mk.env_var);
    }
    if (mk.provider == "file") {
        return std::make_shared<FileMasterKeyProvider>(mk.file, mk.generate_if_missing);
    }
    throw std::invalid_argument(std::format("Unknown master key provider '{}'", mk.provider));
}

void VaultBuilder::make_storage(VaultContext& ctx) {
    const auto& storage = config_.storage;

    if (storage.backend == "postgresql" && (!credentials_ || !audit_repository_)) {
        PoolConfig pool_cfg;
        pool_cfg.connection_string = storage.connection_string;
        pool_cfg.min_connections = storage.min_connections;
        pool_cfg.max_connections = storage.max_connections;
        pool_cfg.acquire_timeout = storage.acquire_timeout;
        pool_cfg.idle_timeout = storage.idle_timeout;
        pool_cfg.statement_timeout_ms = static_cast<uint32_t>(storage.statement_timeout.count());

        ctx.pool = std::make_shared<ConnectionPool>(
            "credentials", pool_cfg, std::make_shared<PgConnectionFactory>());
        if (storage.create_schema) {
            pg_schema::ensure_schema(*ctx.pool);
        }
    } else if (storage.backend != "memory" && storage.backend != "postgresql") {
        throw std::invalid_argument(std::format("Unknown storage backend '{}'", storage.backend));
    }

    ctx.credentials = credentials_;
    if (!ctx.credentials) {
        if (ctx.pool) ctx.credentials = std::make_shared<PgCredentialRepository>(ctx.pool);
        else          ctx.credentials = std::make_shared<MemoryCredentialRepository>();
    }

    ctx.audit_repository = audit_repository_;
    if (!ctx.audit_repository) {
        if (ctx.pool) ctx.audit_repository = std::make_shared<PgAuditRepository>(ctx.pool);
        else          ctx.audit_repository = std::make_shared<MemoryAuditRepository>();
    }
}

VaultContext VaultBuilder::build() {
    if (const auto level = utils::log::parse_level(config_.logging.level)) {
        utils::log::set_level(*level);
    }

    VaultContext ctx;

    ctx.key_provider = key_provider_ ? key_provider_ : make_key_provider();
    if (!ctx.key_provider->master_key()) {
        throw std::invalid_argument(std::format(
            "Master key is missing or empty ({})", ctx.key_provider->name()));
    }

    CredentialCipher::Config cipher_cfg;
    cipher_cfg.kdf_iterations = config_.vault.kdf_iterations;
    ctx.cipher = std::make_shared<CredentialCipher>(ctx.key_provider, cipher_cfg);

    make_storage(ctx);

    AuditLog::Config audit_cfg;
    audit_cfg.default_list_limit = config_.audit.default_list_limit;
    audit_cfg.max_list_limit = config_.audit.max_list_limit;
    ctx.audit_log = std::make_shared<AuditLog>(ctx.audit_repository, audit_cfg);

    if (config_.audit.file.enabled) {
        FileSink::Config sink_cfg;
        sink_cfg.output_file = config_.audit.file.output_file;
        sink_cfg.max_file_size_bytes = config_.audit.file.max_file_size_mb * 1024ULL * 1024;
        sink_cfg.max_files = config_.audit.file.max_files;
        ctx.audit_log->add_sink(std::make_unique<FileSink>(sink_cfg));
    }

    const auto scope = parse_delete_scope(config_.vault.delete_scope);
    if (!scope) {
        throw std::invalid_argument(std::format("Unknown delete scope '{}'", config_.vault.delete_scope));
    }

    CredentialStore::Config store_cfg;
    store_cfg.allowed_engines = config_.vault.allowed_engines;
    store_cfg.delete_scope = *scope;
    store_cfg.lock_stripes = config_.vault.lock_stripes;
    ctx.store = std::make_shared<CredentialStore>(
        ctx.credentials, ctx.cipher, ctx.audit_log, std::move(store_cfg));

    ctx.tracker = std::make_shared<ConnectionStateTracker>();

    ConnectionRegistry::Config registry_cfg;
    registry_cfg.single_active_connection = config_.vault.single_active_connection;
    ctx.registry = std::make_shared<ConnectionRegistry>(ctx.store, ctx.tracker, registry_cfg);

    utils::log::info(std::format("Vault ready: backend={} key={} kdf_iterations={} delete_scope={}",
        ctx.pool ? "postgresql" : "memory", ctx.key_provider->name(),
        ctx.cipher->kdf_iterations(), config_.vault.delete_scope));
    return ctx;
}

} // namespace credvault
