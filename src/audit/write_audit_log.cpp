#include "audit/write_audit_log.hpp"

#include <algorithm>

namespace sqlgate {

WriteAuditLog::WriteAuditLog(const Config& config)
    : config_(config) {}

bool WriteAuditLog::record(WriteAuditEntry entry) {
    if (!config_.enabled || config_.max_entries == 0) return false;

    std::lock_guard lock(mutex_);
    if (entries_.size() >= config_.max_entries) {
        entries_.pop_front();
    }
    entries_.push_back(std::move(entry));
    return true;
}

std::vector<WriteAuditEntry> WriteAuditLog::list(int64_t limit) const {
    if (!config_.enabled || limit <= 0) return {};

    std::lock_guard lock(mutex_);
    const size_t count = std::min(entries_.size(), static_cast<size_t>(limit));
    return {entries_.rbegin(), entries_.rbegin() + static_cast<std::ptrdiff_t>(count)};
}

size_t WriteAuditLog::clear() {
    if (!config_.enabled) return 0;

    std::lock_guard lock(mutex_);
    const size_t cleared = entries_.size();
    entries_.clear();
    return cleared;
}

size_t WriteAuditLog::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

} // namespace sqlgate
