#include "audit/audit_log.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace credvault {

AuditLog::AuditLog(std::shared_ptr<IAuditRepository> repository, const Config& config)
    : repository_(std::move(repository)),
      config_(config) {
    if (!repository_) {
        throw std::invalid_argument("AuditLog requires an audit repository");
    }
    if (config_.max_list_limit == 0) {
        config_.max_list_limit = 1;
    }
    config_.default_list_limit = std::min(config_.default_list_limit, config_.max_list_limit);
}

AuditLog::AuditLog(std::shared_ptr<IAuditRepository> repository)
    : AuditLog(std::move(repository), Config{}) {}

AuditLog::~AuditLog() {
    shutdown();
}

void AuditLog::add_sink(std::unique_ptr<IAuditSink> sink) {
    if (!sink) return;
    utils::log::info(std::format("Audit mirror sink attached: {}", sink->name()));
    sinks_.push_back(std::move(sink));
}

void AuditLog::record(AuditEntry entry) noexcept {
    if (entry.timestamp == Timestamp{}) {
        entry.timestamp = utils::now();
    }

    try {
        entry.id = repository_->append(entry);
        total_recorded_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception& e) {
        write_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Audit write failed ({} {} hash={}): {}",
            audit_operation_to_string(entry.operation),
            entry.success ? "ok" : "failed",
            utils::short_hash(entry.connection_hash), e.what()));
        return;
    }

    for (auto& sink : sinks_) {
        bool ok = false;
        try {
            ok = sink->write(entry);
        } catch (const std::exception& e) {
            utils::log::warn(std::format("Audit sink {} threw: {}", sink->name(), e.what()));
        }
        if (!ok) {
            sink_write_failures_.fetch_add(1, std::memory_order_relaxed);
        }
    }
}

size_t AuditLog::effective_limit(std::optional<size_t> requested) const {
    if (!requested) return config_.default_list_limit;
    return std::min(*requested, config_.max_list_limit);
}

std::vector<AuditEntry> AuditLog::list(std::optional<int64_t> credential_id,
                                       std::optional<size_t> limit) const {
    const size_t n = effective_limit(limit);
    if (n == 0) return {};
    return repository_->list(credential_id, n);
}

void AuditLog::flush() {
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void AuditLog::shutdown() {
    for (auto& sink : sinks_) {
        sink->shutdown();
    }
}

AuditLog::Stats AuditLog::get_stats() const {
    return {
        .total_recorded = total_recorded_.load(std::memory_order_relaxed),
        .write_failures = write_failures_.load(std::memory_order_relaxed),
        .sink_write_failures = sink_write_failures_.load(std::memory_order_relaxed),
        .active_sinks = sinks_.size(),
    };
}

} // namespace credvault
