#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace credvault {

/**
 * @brief TOML configuration loader
 *
 * ${VAR} references in string values are expanded from the environment
 * before extraction. Every section is optional; missing keys take the
 * defaults in config_types.hpp. Validation collects all violations and
 * reports them in one message.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        VaultConfig config;

        static LoadResult ok(VaultConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to vault.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// All violations in the config, empty when valid
    [[nodiscard]] static std::vector<std::string> validate_config(const VaultConfig& config);

private:
    static LoadResult validate_and_return(VaultConfig config);
};

} // namespace credvault
