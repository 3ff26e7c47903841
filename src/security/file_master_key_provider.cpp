#include "security/file_master_key_provider.hpp"
#include "core/utils.hpp"

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include <filesystem>
#include <format>
#include <fstream>
#include <vector>

namespace credvault {

FileMasterKeyProvider::FileMasterKeyProvider(const std::string& key_file,
                                             bool generate_if_missing)
    : key_file_(key_file) {
    if (key_file_.empty()) {
        utils::log::warn("FileMasterKeyProvider: no key file configured");
        return;
    }

    std::error_code ec;
    const bool exists = std::filesystem::exists(key_file_, ec);
    if (!exists && generate_if_missing) {
        if (generate_and_save_key()) {
            utils::log::info(std::format("FileMasterKeyProvider: generated new master key at '{}'",
                key_file_));
        }
        return;
    }

    if (load_key()) {
        utils::log::info(std::format("FileMasterKeyProvider: loaded master key from '{}'",
            key_file_));
    } else {
        utils::log::warn(std::format("FileMasterKeyProvider: no usable key in '{}'", key_file_));
    }
}

FileMasterKeyProvider::~FileMasterKeyProvider() {
    if (!key_.empty()) {
        OPENSSL_cleanse(key_.data(), key_.size());
    }
}

std::optional<std::string> FileMasterKeyProvider::master_key() const {
    if (key_.empty()) return std::nullopt;
    return key_;
}

std::string FileMasterKeyProvider::name() const {
    return "file:" + key_file_;
}

bool FileMasterKeyProvider::load_key() {
    std::ifstream file(key_file_);
    if (!file.is_open()) return false;

    std::string line;
    while (std::getline(file, line)) {
        line = utils::trim(line);
        if (line.empty() || line[0] == '#') continue;
        key_ = std::move(line);
        return true;
    }
    return false;
}

bool FileMasterKeyProvider::generate_and_save_key() {
    std::vector<uint8_t> bytes(32); // 256 bits
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        utils::log::error("FileMasterKeyProvider: RAND_bytes failed");
        return false;
    }
    std::string hex = utils::bytes_to_hex(bytes.data(), bytes.size());
    OPENSSL_cleanse(bytes.data(), bytes.size());

    {
        std::ofstream file(key_file_, std::ios::trunc);
        if (!file.is_open()) {
            utils::log::error(std::format("FileMasterKeyProvider: cannot write '{}'", key_file_));
            OPENSSL_cleanse(hex.data(), hex.size());
            return false;
        }
        file << "# credvault master key (hex)\n" << hex << '\n';
    }

    std::error_code ec;
    std::filesystem::permissions(key_file_,
        std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
        std::filesystem::perm_options::replace, ec);
    if (ec) {
        utils::log::warn(std::format("FileMasterKeyProvider: could not restrict permissions on '{}': {}",
            key_file_, ec.message()));
    }

    key_ = std::move(hex);
    return true;
}

} // namespace credvault
