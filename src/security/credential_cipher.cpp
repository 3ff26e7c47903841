#include "security/credential_cipher.hpp"
#include "core/base64.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <format>
#include <limits>
#include <stdexcept>

namespace credvault {

namespace {

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherCtxPtr make_ctx() {
    return CipherCtxPtr(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
}

// Wipes derived key material on scope exit
struct KeyWiper {
    std::vector<uint8_t>& key;
    ~KeyWiper() { OPENSSL_cleanse(key.data(), key.size()); }
};

} // anonymous namespace

CredentialCipher::CredentialCipher(std::shared_ptr<IMasterKeyProvider> key_provider,
                                   const Config& config)
    : config_(config) {
    if (!key_provider) {
        throw std::invalid_argument("CredentialCipher: master key provider is required");
    }
    if (config_.kdf_iterations < kMinKdfIterations) {
        throw std::invalid_argument(std::format(
            "CredentialCipher: kdf_iterations must be >= {}, got {}",
            kMinKdfIterations, config_.kdf_iterations));
    }
    // PKCS5_PBKDF2_HMAC takes an int
    if (config_.kdf_iterations > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument(std::format(
            "CredentialCipher: kdf_iterations must be <= {}, got {}",
            std::numeric_limits<int>::max(), config_.kdf_iterations));
    }

    auto key = key_provider->master_key();
    if (!key || key->empty()) {
        throw std::invalid_argument(std::format(
            "CredentialCipher: no master key available from {}", key_provider->name()));
    }
    master_key_ = *key;
    OPENSSL_cleanse(key->data(), key->size());

    utils::log::info(std::format("CredentialCipher: AES-256-GCM, PBKDF2-SHA256 x{}, key source {}",
        config_.kdf_iterations, key_provider->name()));
}

CredentialCipher::~CredentialCipher() {
    if (!master_key_.empty()) {
        OPENSSL_cleanse(master_key_.data(), master_key_.size());
    }
}

std::vector<uint8_t> CredentialCipher::derive_key(const std::vector<uint8_t>& salt) const {
    std::vector<uint8_t> key(kKeyLen);
    if (PKCS5_PBKDF2_HMAC(
            master_key_.data(), static_cast<int>(master_key_.size()),
            salt.data(), static_cast<int>(salt.size()),
            static_cast<int>(config_.kdf_iterations),
            EVP_sha256(),
            static_cast<int>(kKeyLen), key.data()) != 1) {
        throw CipherError("PKCS5_PBKDF2_HMAC failed");
    }
    return key;
}

EncryptedSecret CredentialCipher::encrypt(std::string_view secret) const {
    std::vector<uint8_t> salt(kSaltLen);
    uint8_t iv[kIvLen];
    if (RAND_bytes(salt.data(), static_cast<int>(kSaltLen)) != 1 ||
        RAND_bytes(iv, static_cast<int>(kIvLen)) != 1) {
        throw CipherError("RAND_bytes failed");
    }

    auto key = derive_key(salt);
    KeyWiper wiper{key};

    auto ctx = make_ctx();
    if (!ctx) throw CipherError("EVP_CIPHER_CTX_new failed");

    std::vector<uint8_t> ciphertext(secret.size() + EVP_MAX_BLOCK_LENGTH);
    uint8_t tag[kTagLen];
    int len = 0;
    int ciphertext_len = 0;

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvLen), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv) != 1) {
        throw CipherError("AES-256-GCM init failed");
    }
    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
            reinterpret_cast<const uint8_t*>(secret.data()),
            static_cast<int>(secret.size())) != 1) {
        throw CipherError("AES-256-GCM encrypt failed");
    }
    ciphertext_len = len;
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + len, &len) != 1) {
        throw CipherError("AES-256-GCM finalize failed");
    }
    ciphertext_len += len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagLen), tag) != 1) {
        throw CipherError("AES-256-GCM tag extraction failed");
    }

    // Pack: iv + ciphertext + tag
    std::vector<uint8_t> packed;
    packed.reserve(kIvLen + ciphertext_len + kTagLen);
    packed.insert(packed.end(), iv, iv + kIvLen);
    packed.insert(packed.end(), ciphertext.begin(), ciphertext.begin() + ciphertext_len);
    packed.insert(packed.end(), tag, tag + kTagLen);

    return {base64::encode(packed), utils::bytes_to_hex(salt.data(), salt.size())};
}

std::string CredentialCipher::decrypt(std::string_view ciphertext, std::string_view salt_hex) const {
    if (salt_hex.size() != kSaltLen * 2) {
        throw DecryptionError(std::format("salt must be {} hex chars, got {}",
            kSaltLen * 2, salt_hex.size()));
    }
    const auto salt = utils::hex_to_bytes(salt_hex);
    if (salt.size() != kSaltLen) {
        throw DecryptionError("salt is not valid hex");
    }

    const auto packed = base64::decode(ciphertext);
    if (!packed) {
        throw DecryptionError("ciphertext is not valid base64");
    }
    if (packed->size() < kIvLen + kTagLen) {
        throw DecryptionError("ciphertext too short");
    }

    const uint8_t* iv = packed->data();
    const size_t ct_len = packed->size() - kIvLen - kTagLen;
    const uint8_t* ct = packed->data() + kIvLen;
    const uint8_t* tag = packed->data() + kIvLen + ct_len;

    std::vector<uint8_t> key;
    try {
        key = derive_key(salt);
    } catch (const CipherError& e) {
        throw DecryptionError(e.what());
    }
    KeyWiper wiper{key};

    auto ctx = make_ctx();
    if (!ctx) throw DecryptionError("EVP_CIPHER_CTX_new failed");

    std::vector<uint8_t> plaintext(ct_len + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    int plaintext_len = 0;

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvLen), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv) != 1) {
        throw DecryptionError("AES-256-GCM init failed");
    }
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ct, static_cast<int>(ct_len)) != 1) {
        throw DecryptionError("AES-256-GCM decrypt failed");
    }
    plaintext_len = len;

    // Set expected tag
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagLen),
            const_cast<uint8_t*>(tag)) != 1) {
        throw DecryptionError("AES-256-GCM tag setup failed");
    }

    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + len, &len) <= 0) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        throw DecryptionError("authentication failed (wrong key or corrupted ciphertext)");
    }
    plaintext_len += len;

    std::string result(reinterpret_cast<const char*>(plaintext.data()),
                       static_cast<size_t>(plaintext_len));
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    return result;
}

} // namespace credvault
