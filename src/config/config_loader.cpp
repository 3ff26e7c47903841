#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>

using namespace std::string_literals;

namespace credvault {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

/// Non-negative integer with default; negatives clamp to zero and fail validation later
/// @throws std::out_of_range if the value does not fit T
template<typename T>
T toml_unsigned(const toml::table& tbl, const std::string_view key, T fallback) {
    const int64_t raw = tbl[key].value_or(static_cast<int64_t>(fallback));
    const auto clamped = static_cast<uint64_t>(std::max<int64_t>(raw, 0));
    constexpr auto kMax = static_cast<uint64_t>(std::numeric_limits<T>::max());
    if (clamped > kMax) {
        throw std::out_of_range(std::format("{} = {} is out of range (max {})", key, raw, kMax));
    }
    return static_cast<T>(clamped);
}

// ---- Section extractors ----------------------------------------------------

VaultSettings extract_vault(const toml::table& root) {
    VaultSettings cfg;
    const auto* vault = root["vault"].as_table();
    if (!vault) return cfg;
    const auto& v = *vault;

    cfg.kdf_iterations = toml_unsigned<uint32_t>(v, "kdf_iterations", cfg.kdf_iterations);
    cfg.delete_scope = v["delete_scope"].value_or("any"s);
    if (v["allowed_engines"].is_array()) {
        cfg.allowed_engines = toml_string_array(v, "allowed_engines");
    }
    cfg.single_active_connection = v["single_active_connection"].value_or(true);
    cfg.lock_stripes = toml_unsigned<size_t>(v, "lock_stripes", cfg.lock_stripes);

    if (const auto* mk = v["master_key"].as_table()) {
        cfg.master_key.provider = (*mk)["provider"].value_or("env"s);
        cfg.master_key.env_var = (*mk)["env_var"].value_or("CREDENTIAL_MASTER_KEY"s);
        cfg.master_key.file = (*mk)["file"].value_or(""s);
        cfg.master_key.generate_if_missing = (*mk)["generate_if_missing"].value_or(false);
    }
    return cfg;
}

StorageConfig extract_storage(const toml::table& root) {
    StorageConfig cfg;
    const auto* storage = root["storage"].as_table();
    if (!storage) return cfg;
    const auto& s = *storage;

    cfg.backend = s["backend"].value_or("memory"s);
    cfg.connection_string = s["connection_string"].value_or(""s);
    cfg.min_connections = toml_unsigned<size_t>(s, "min_connections", cfg.min_connections);
    cfg.max_connections = toml_unsigned<size_t>(s, "max_connections", cfg.max_connections);
    cfg.acquire_timeout = std::chrono::milliseconds(
        toml_unsigned<int64_t>(s, "acquire_timeout_ms", cfg.acquire_timeout.count()));
    cfg.statement_timeout = std::chrono::milliseconds(
        toml_unsigned<int64_t>(s, "statement_timeout_ms", cfg.statement_timeout.count()));
    cfg.idle_timeout = std::chrono::seconds(
        toml_unsigned<int64_t>(s, "idle_timeout_seconds", cfg.idle_timeout.count()));
    cfg.create_schema = s["create_schema"].value_or(true);
    return cfg;
}

AuditSettings extract_audit(const toml::table& root) {
    AuditSettings cfg;
    const auto* audit = root["audit"].as_table();
    if (!audit) return cfg;
    const auto& a = *audit;

    cfg.default_list_limit = toml_unsigned<size_t>(a, "default_list_limit", cfg.default_list_limit);
    cfg.max_list_limit = toml_unsigned<size_t>(a, "max_list_limit", cfg.max_list_limit);

    if (const auto* file = a["file"].as_table()) {
        cfg.file.enabled = (*file)["enabled"].value_or(false);
        cfg.file.output_file = (*file)["output_file"].value_or("credential_audit.jsonl"s);
        cfg.file.max_file_size_mb = toml_unsigned<size_t>(*file, "max_file_size_mb",
                                                          cfg.file.max_file_size_mb);
        cfg.file.max_files = static_cast<int>((*file)["max_files"].value_or(10));
    }
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

VaultConfig extract_all_sections(const toml::table& tbl) {
    VaultConfig config;
    config.vault = extract_vault(tbl);
    config.storage = extract_storage(tbl);
    config.audit = extract_audit(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(VaultConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const VaultConfig& config) {
    std::vector<std::string> errors;

    const auto& vault = config.vault;
    if (vault.kdf_iterations < 100000) {
        errors.push_back(std::format(
            "vault.kdf_iterations must be at least 100000, got {}", vault.kdf_iterations));
    }
    if (vault.kdf_iterations > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
        errors.push_back(std::format("vault.kdf_iterations must be at most {}, got {}",
            std::numeric_limits<int>::max(), vault.kdf_iterations));
    }
    if (!parse_delete_scope(vault.delete_scope)) {
        errors.push_back(std::format(
            "vault.delete_scope must be \"any\" or \"owner\", got \"{}\"", vault.delete_scope));
    }
    if (vault.allowed_engines.empty()) {
        errors.push_back("vault.allowed_engines must not be empty");
    }
    for (const auto& engine : vault.allowed_engines) {
        if (!parse_engine_type(engine)) {
            errors.push_back(std::format("vault.allowed_engines: unknown engine \"{}\"", engine));
        }
    }
    if (vault.lock_stripes == 0) {
        errors.push_back("vault.lock_stripes must be > 0");
    }

    const auto& mk = vault.master_key;
    if (mk.provider == "env") {
        if (mk.env_var.empty()) {
            errors.push_back("vault.master_key.env_var must not be empty");
        }
    } else if (mk.provider == "file") {
        if (mk.file.empty()) {
            errors.push_back("vault.master_key.file required when provider = \"file\"");
        }
    } else {
        errors.push_back(std::format(
            "vault.master_key.provider must be \"env\" or \"file\", got \"{}\"", mk.provider));
    }

    const auto& storage = config.storage;
    if (storage.backend == "postgresql") {
        if (storage.connection_string.empty()) {
            errors.push_back("storage.connection_string required when backend = \"postgresql\"");
        }
        if (storage.max_connections == 0) {
            errors.push_back("storage.max_connections must be > 0");
        }
        if (storage.min_connections > storage.max_connections) {
            errors.push_back(std::format(
                "storage.min_connections ({}) > max_connections ({})",
                storage.min_connections, storage.max_connections));
        }
    } else if (storage.backend != "memory") {
        errors.push_back(std::format(
            "storage.backend must be \"memory\" or \"postgresql\", got \"{}\"", storage.backend));
    }

    const auto& audit = config.audit;
    if (audit.max_list_limit == 0) {
        errors.push_back("audit.max_list_limit must be > 0");
    }
    if (audit.default_list_limit > audit.max_list_limit) {
        errors.push_back(std::format(
            "audit.default_list_limit ({}) > max_list_limit ({})",
            audit.default_list_limit, audit.max_list_limit));
    }
    if (audit.file.enabled) {
        if (audit.file.output_file.empty()) {
            errors.push_back("audit.file.output_file required when audit.file.enabled is true");
        }
        if (audit.file.max_files < 1) {
            errors.push_back("audit.file.max_files must be >= 1");
        }
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got \"{}\"", config.logging.level));
    }

    return errors;
}

} // namespace credvault
