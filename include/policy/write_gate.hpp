#pragma once

#include <atomic>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace sqlgate {

/**
 * @brief Admission control for non-read statements
 *
 * Two independent conditions must both hold for a write to run:
 * 1. The process-wide write switch is on
 * 2. The statement's verb (first keyword, lower-cased) is whitelisted
 *
 * Nothing past the leading keyword is inspected. The verb is a routing
 * hint, not a safety proof.
 *
 * Thread-safety: switch is an atomic<bool>; whitelist is a std::set
 * behind a shared_mutex (add/remove exclusive, lookups shared).
 */
class WriteGate {
public:
    struct Config {
        bool writes_enabled = false;
        std::vector<std::string> whitelist = {
            "insert", "update", "delete", "create", "drop", "alter", "truncate", "replace"};
    };

    WriteGate() : WriteGate(Config{}) {}
    explicit WriteGate(const Config& config);

    /**
     * @brief Leading keyword of a statement, lower-cased; empty for blank input
     */
    [[nodiscard]] static std::string classify(std::string_view statement);

    /**
     * @brief Trim + lower-case a whitelist keyword
     */
    [[nodiscard]] static std::string normalize(std::string_view keyword);

    /**
     * @brief Switch on AND verb whitelisted
     */
    [[nodiscard]] bool is_allowed(std::string_view verb) const;

    /**
     * @brief Whitelist membership only (ignores the switch)
     */
    [[nodiscard]] bool contains(std::string_view verb) const;

    /**
     * @return false if already present or blank
     */
    bool add(std::string_view keyword);

    /**
     * @return false if absent
     */
    bool remove(std::string_view keyword);

    /**
     * @brief Current whitelist, lexicographically sorted
     */
    [[nodiscard]] std::vector<std::string> list() const;

    /**
     * @return true only if the switch actually changed
     */
    bool enable();
    bool disable();

    [[nodiscard]] bool is_enabled() const {
        return enabled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> enabled_;
    std::set<std::string, std::less<>> whitelist_;
    mutable std::shared_mutex mutex_;
};

} // namespace sqlgate
