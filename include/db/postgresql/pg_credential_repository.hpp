#pragma once

#include "db/icredential_repository.hpp"
#include "db/idb_connection.hpp"

#include <memory>

namespace credvault {

class ConnectionPool;

/**
 * @brief Credential rows in the database_credentials table
 *
 * The UNIQUE constraint on connection_hash backs the one-row-per-identity
 * rule across processes. reactivate() and soft_delete() are guarded
 * single-statement UPDATEs, so a lost race shows up as "no row changed".
 */
class PgCredentialRepository : public ICredentialRepository {
public:
    explicit PgCredentialRepository(std::shared_ptr<ConnectionPool> pool);

    [[nodiscard]] std::optional<Credential> find_by_id(int64_t id) override;
    [[nodiscard]] std::optional<Credential> find_by_hash(const std::string& connection_hash) override;
    [[nodiscard]] std::optional<Credential> find_active_by_hash(const std::string& connection_hash) override;
    [[nodiscard]] Credential insert(const Credential& credential) override;
    [[nodiscard]] bool reactivate(const Credential& credential) override;
    bool touch(int64_t id, Timestamp when) override;
    [[nodiscard]] bool soft_delete(int64_t id, Timestamp when) override;
    [[nodiscard]] std::vector<Credential> list_active(
        const std::optional<std::string>& owner_session) override;

private:
    std::optional<Credential> find_one(const std::string& where, const std::vector<DbParam>& params);
    static Credential row_to_credential(const std::vector<DbCell>& row);

    std::shared_ptr<ConnectionPool> pool_;
};

} // namespace credvault
