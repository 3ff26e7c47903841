#include "audit/file_sink.hpp"
#include "core/json_codec.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace credvault {

FileSink::FileSink(const Config& config)
    : config_(config) {
    if (config_.max_files < 1) {
        config_.max_files = 1;
    }

    file_stream_.open(config_.output_file, std::ios::app);
    if (!file_stream_.is_open()) {
        throw std::runtime_error("Failed to open audit file: " + config_.output_file);
    }

    std::error_code ec;
    const auto file_size = std::filesystem::file_size(config_.output_file, ec);
    if (!ec) {
        current_file_size_ = static_cast<size_t>(file_size);
    }
}

FileSink::~FileSink() {
    shutdown();
}

bool FileSink::write(const AuditEntry& entry) {
    const std::string line = json_codec::dump(json_codec::audit_entry_to_json(entry)) + "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_stream_.is_open()) {
        return false;
    }
    if (config_.max_file_size_bytes > 0 &&
        current_file_size_ + line.size() > config_.max_file_size_bytes &&
        current_file_size_ > 0) {
        rotate_file();
    }

    file_stream_.write(line.data(), static_cast<std::streamsize>(line.size()));
    current_file_size_ += line.size();
    return file_stream_.good();
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_stream_.flush();
}

void FileSink::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

std::string FileSink::name() const {
    return "file:" + config_.output_file;
}

size_t FileSink::rotation_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rotation_count_;
}

size_t FileSink::current_file_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_file_size_;
}

void FileSink::rotate_file() {
    file_stream_.flush();
    file_stream_.close();

    std::error_code ec;

    // Drop the oldest, then shift .N -> .N+1
    std::filesystem::remove(std::format("{}.{}", config_.output_file, config_.max_files), ec);
    for (int i = config_.max_files - 1; i >= 1; --i) {
        std::filesystem::rename(
            std::format("{}.{}", config_.output_file, i),
            std::format("{}.{}", config_.output_file, i + 1), ec);
    }
    std::filesystem::rename(config_.output_file, config_.output_file + ".1", ec);

    file_stream_.open(config_.output_file, std::ios::app);
    current_file_size_ = 0;
    ++rotation_count_;
}

} // namespace credvault
