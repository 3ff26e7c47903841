#pragma once

#include "security/imaster_key_provider.hpp"

#include <string>

namespace credvault {

/**
 * @brief Key-file master key provider
 *
 * The file holds the key on the first line that is neither blank nor a
 * '#' comment. With generate_if_missing, an absent file is created with a
 * fresh 256-bit random key (hex) and mode 0600.
 */
class FileMasterKeyProvider : public IMasterKeyProvider {
public:
    explicit FileMasterKeyProvider(const std::string& key_file,
                                   bool generate_if_missing = false);
    ~FileMasterKeyProvider() override;

    [[nodiscard]] std::optional<std::string> master_key() const override;
    [[nodiscard]] std::string name() const override;

private:
    std::string key_file_;
    std::string key_;

    bool load_key();
    bool generate_and_save_key();
};

} // namespace credvault
