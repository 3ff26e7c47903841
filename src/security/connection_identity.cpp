#include "security/connection_identity.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <format>
#include <memory>
#include <stdexcept>

namespace credvault {

std::string ConnectionIdentity::canonical_form(
    std::string_view host,
    uint16_t port,
    std::string_view database,
    std::string_view username,
    std::string_view engine_type) {
    return std::format("{}:{}/{}@{}:{}", host, port, database, username, engine_type);
}

std::string ConnectionIdentity::fingerprint(
    std::string_view host,
    uint16_t port,
    std::string_view database,
    std::string_view username,
    std::string_view engine_type) {

    const std::string input = canonical_form(host, port, database, username, engine_type);

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    uint8_t hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    return utils::bytes_to_hex(hash, hash_len);
}

std::string ConnectionIdentity::fingerprint(const ConnectionIdentityFields& fields) {
    return fingerprint(fields.host, fields.port, fields.database,
                       fields.username, fields.engine_type);
}

} // namespace credvault
