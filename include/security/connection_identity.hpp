#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace credvault {

/**
 * @brief Deterministic fingerprint of a connection's identity fields
 *
 * SHA-256 over the canonical form "{host}:{port}/{database}@{username}:{engine_type}",
 * rendered as 64 lowercase hex chars. Case-sensitive, no normalization.
 */
class ConnectionIdentity {
public:
    [[nodiscard]] static std::string fingerprint(
        std::string_view host,
        uint16_t port,
        std::string_view database,
        std::string_view username,
        std::string_view engine_type);

    [[nodiscard]] static std::string fingerprint(const ConnectionIdentityFields& fields);

    [[nodiscard]] static std::string canonical_form(
        std::string_view host,
        uint16_t port,
        std::string_view database,
        std::string_view username,
        std::string_view engine_type);

    static constexpr size_t kHashLength = 64;
};

} // namespace credvault
