#pragma once

#include <optional>
#include <string>

namespace credvault {

/**
 * @brief Source of the process-wide master key
 *
 * The key is an opaque passphrase; CredentialCipher stretches it with
 * PBKDF2 per salt. Implementations read their source once, at construction.
 */
class IMasterKeyProvider {
public:
    virtual ~IMasterKeyProvider() = default;

    /// The master key, or nullopt when the source is missing or empty
    [[nodiscard]] virtual std::optional<std::string> master_key() const = 0;

    /// Human-readable source name for logging (never the key itself)
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace credvault
