#pragma once

#include "security/imaster_key_provider.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace credvault {

struct EncryptedSecret {
    std::string ciphertext;     // base64(iv | ciphertext | tag)
    std::string salt;           // 32 hex chars (128-bit)
};

/**
 * @brief Password-based authenticated encryption of stored secrets
 *
 * Each encrypt() draws a fresh 128-bit salt and a fresh 96-bit IV. The
 * AES-256-GCM key is PBKDF2-HMAC-SHA256(master_key, salt, iterations).
 * decrypt() re-derives the key from the stored salt and throws
 * DecryptionError on malformed input, a wrong key, or a failed tag check.
 *
 * The master key is read from the provider once, in the constructor.
 * Thread-safe: no mutable state after construction.
 */
class CredentialCipher {
public:
    struct Config {
        uint32_t kdf_iterations = 100000;
    };

    static constexpr uint32_t kMinKdfIterations = 100000;
    static constexpr size_t kSaltLen = 16;
    static constexpr size_t kIvLen = 12;
    static constexpr size_t kTagLen = 16;
    static constexpr size_t kKeyLen = 32;

    /// @throws std::invalid_argument if the provider has no key or iterations < floor
    CredentialCipher(std::shared_ptr<IMasterKeyProvider> key_provider, const Config& config);
    ~CredentialCipher();

    CredentialCipher(const CredentialCipher&) = delete;
    CredentialCipher& operator=(const CredentialCipher&) = delete;

    /// @throws CipherError on OpenSSL failure
    [[nodiscard]] EncryptedSecret encrypt(std::string_view secret) const;

    /// @throws DecryptionError
    [[nodiscard]] std::string decrypt(std::string_view ciphertext, std::string_view salt) const;

    [[nodiscard]] uint32_t kdf_iterations() const { return config_.kdf_iterations; }

private:
    std::vector<uint8_t> derive_key(const std::vector<uint8_t>& salt) const;

    std::string master_key_;
    Config config_;
};

} // namespace credvault
