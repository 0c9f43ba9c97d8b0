#include "policy/write_gate.hpp"
#include "core/utils.hpp"

#include <format>
#include <mutex>

namespace sqlgate {

WriteGate::WriteGate(const Config& config)
    : enabled_(config.writes_enabled) {
    for (const auto& keyword : config.whitelist) {
        auto normalized = normalize(keyword);
        if (!normalized.empty()) {
            whitelist_.insert(std::move(normalized));
        }
    }
}

std::string WriteGate::classify(std::string_view statement) {
    const std::string_view trimmed = utils::trim(statement);
    size_t end = 0;
    while (end < trimmed.size() && !utils::is_space(trimmed[end])) {
        ++end;
    }
    return utils::to_lower(trimmed.substr(0, end));
}

std::string WriteGate::normalize(std::string_view keyword) {
    return utils::to_lower(utils::trim(keyword));
}

bool WriteGate::is_allowed(std::string_view verb) const {
    if (!is_enabled()) {
        return false;
    }
    return contains(verb);
}

bool WriteGate::contains(std::string_view verb) const {
    if (verb.empty()) {
        return false;
    }
    std::shared_lock lock(mutex_);
    return whitelist_.find(verb) != whitelist_.end();
}

bool WriteGate::add(std::string_view keyword) {
    auto normalized = normalize(keyword);
    if (normalized.empty()) {
        return false;
    }

    bool inserted = false;
    {
        std::unique_lock lock(mutex_);
        inserted = whitelist_.insert(normalized).second;
    }
    if (inserted) {
        utils::log::info(std::format("Write whitelist: added '{}'", normalized));
    }
    return inserted;
}

bool WriteGate::remove(std::string_view keyword) {
    const auto normalized = normalize(keyword);
    if (normalized.empty()) {
        return false;
    }

    bool erased = false;
    {
        std::unique_lock lock(mutex_);
        erased = whitelist_.erase(normalized) > 0;
    }
    if (erased) {
        utils::log::info(std::format("Write whitelist: removed '{}'", normalized));
    }
    return erased;
}

std::vector<std::string> WriteGate::list() const {
    std::shared_lock lock(mutex_);
    return {whitelist_.begin(), whitelist_.end()};
}

bool WriteGate::enable() {
    const bool changed = !enabled_.exchange(true, std::memory_order_acq_rel);
    if (changed) {
        utils::log::warn("Write operations ENABLED");
    }
    return changed;
}

bool WriteGate::disable() {
    const bool changed = enabled_.exchange(false, std::memory_order_acq_rel);
    if (changed) {
        utils::log::info("Write operations disabled");
    }
    return changed;
}

} // namespace sqlgate
