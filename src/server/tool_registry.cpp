#include "server/tool_registry.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlgate {

bool ToolRegistry::register_tool(ToolDescriptor descriptor, ToolHandler handler) {
    const auto [it, inserted] = index_.try_emplace(descriptor.name, entries_.size());
    if (!inserted) {
        utils::log::warn(std::format("Tool '{}' registered twice, keeping the first", descriptor.name));
        return false;
    }
    entries_.push_back(Entry{std::move(descriptor), std::move(handler)});
    return true;
}

const ToolRegistry::Entry* ToolRegistry::find(std::string_view name) const {
    const auto it = index_.find(std::string(name));
    return it == index_.end() ? nullptr : &entries_[it->second];
}

std::string ToolRegistry::list_json() const {
    std::string out = "[";
    for (size_t i = 0; i < entries_.size(); ++i) {
        const auto& d = entries_[i].descriptor;
        if (i > 0) out += ',';
        out += std::format(R"({{"name":{},"description":{},"inputSchema":{}}})",
            utils::json_string(d.name), utils::json_string(d.description),
            d.input_schema.empty() ? R"({"type":"object","properties":{}})" : d.input_schema);
    }
    out += ']';
    return out;
}

} // namespace sqlgate
