#include "security/env_master_key_provider.hpp"
#include "core/utils.hpp"

#include <openssl/crypto.h>

#include <cstdlib>
#include <format>

namespace credvault {

EnvMasterKeyProvider::EnvMasterKeyProvider(const std::string& env_var_name)
    : env_var_name_(env_var_name) {
    const char* value = std::getenv(env_var_name_.c_str());
    if (!value || *value == '\0') {
        utils::log::warn(std::format("EnvMasterKeyProvider: environment variable '{}' not set",
            env_var_name_));
        return;
    }

    key_ = value;
    valid_ = true;
    utils::log::info(std::format("EnvMasterKeyProvider: loaded master key from '{}'",
        env_var_name_));
}

EnvMasterKeyProvider::~EnvMasterKeyProvider() {
    if (!key_.empty()) {
        OPENSSL_cleanse(key_.data(), key_.size());
    }
}

std::optional<std::string> EnvMasterKeyProvider::master_key() const {
    if (!valid_) return std::nullopt;
    return key_;
}

std::string EnvMasterKeyProvider::name() const {
    return "env:" + env_var_name_;
}

} // namespace credvault
