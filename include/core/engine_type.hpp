#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace credvault {

namespace keys {
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view MYSQL = "mysql";
    inline constexpr std::string_view MONGODB = "mongodb";
    inline constexpr std::string_view SQLITE = "sqlite";
}

enum class EngineType {
    POSTGRESQL,
    MYSQL,
    MONGODB,
    SQLITE,
};

[[nodiscard]] inline std::string_view engine_type_to_string(EngineType type) {
    switch (type) {
        case EngineType::POSTGRESQL: return keys::POSTGRESQL;
        case EngineType::MYSQL: return keys::MYSQL;
        case EngineType::MONGODB: return keys::MONGODB;
        case EngineType::SQLITE: return keys::SQLITE;
        default: return "unknown";
    }
}

/**
 * @brief Exact-match lookup of a canonical engine name
 *
 * No case folding or aliasing: the engine string takes part in the
 * connection fingerprint, so "PostgreSQL" and "postgresql" are different
 * identities and only the canonical spelling is accepted.
 */
[[nodiscard]] inline std::optional<EngineType> parse_engine_type(std::string_view type_str) {
    static const std::unordered_map<std::string_view, EngineType> lookup = {
        {keys::POSTGRESQL, EngineType::POSTGRESQL},
        {keys::MYSQL,      EngineType::MYSQL},
        {keys::MONGODB,    EngineType::MONGODB},
        {keys::SQLITE,     EngineType::SQLITE},
    };

    if (const auto it = lookup.find(type_str); it != lookup.end()) {
        return it->second;
    }
    return std::nullopt;
}

[[nodiscard]] inline std::vector<std::string> default_allowed_engines() {
    return {std::string(keys::POSTGRESQL), std::string(keys::MYSQL),
            std::string(keys::MONGODB), std::string(keys::SQLITE)};
}

} // namespace credvault
