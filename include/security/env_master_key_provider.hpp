#pragma once

#include "security/imaster_key_provider.hpp"
#include <string>

namespace credvault {

/**
 * @brief Environment variable master key provider
 *
 * Reads the master key verbatim from an environment variable at
 * construction. Later changes to the environment are not observed.
 */
class EnvMasterKeyProvider : public IMasterKeyProvider {
public:
    explicit EnvMasterKeyProvider(const std::string& env_var_name = "CREDENTIAL_MASTER_KEY");
    ~EnvMasterKeyProvider() override;

    [[nodiscard]] std::optional<std::string> master_key() const override;
    [[nodiscard]] std::string name() const override;

private:
    std::string env_var_name_;
    std::string key_;
    bool valid_ = false;
};

} // namespace credvault
