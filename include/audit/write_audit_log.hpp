#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace sqlgate {

/**
 * @brief One successfully executed write
 */
struct WriteAuditEntry {
    std::string handle;
    std::string verb;
    std::chrono::milliseconds duration{0};
    uint64_t affected_rows = 0;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @brief Bounded FIFO of write audit entries
 *
 * When full, the single oldest entry is dropped before the new one is
 * appended, so size() never exceeds max_entries. One mutex covers
 * append+evict, list and clear: readers never observe an over-full buffer.
 *
 * When disabled, record() is a no-op, list() is empty and clear() returns 0.
 */
class WriteAuditLog {
public:
    struct Config {
        bool enabled = true;
        size_t max_entries = 1000;
    };

    WriteAuditLog() : WriteAuditLog(Config{}) {}
    explicit WriteAuditLog(const Config& config);

    /**
     * @return false when auditing is disabled
     */
    bool record(WriteAuditEntry entry);

    /**
     * @brief Up to limit entries, most recent first (limit <= 0 yields none)
     */
    [[nodiscard]] std::vector<WriteAuditEntry> list(int64_t limit) const;

    /**
     * @return Number of entries discarded
     */
    size_t clear();

    [[nodiscard]] size_t size() const;

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }

    [[nodiscard]] size_t capacity() const { return config_.max_entries; }

private:
    Config config_;
    mutable std::mutex mutex_;
    std::deque<WriteAuditEntry> entries_;
};

} // namespace sqlgate
