#pragma once

#include "core/error.hpp"
#include "core/json.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sqlgate {

/**
 * @brief MCP tool metadata as advertised by tools/list
 *
 * input_schema is JSON Schema text embedded verbatim in the listing.
 */
struct ToolDescriptor {
    std::string name;
    std::string description;
    std::string input_schema;
};

/**
 * @brief Tool implementation: arguments object in, JSON result text out
 */
using ToolHandler = std::function<Result<std::string>(const JsonValue& arguments)>;

/**
 * @brief Name → tool lookup for the MCP dispatcher
 *
 * Populated once at startup, read-only afterwards (no locking).
 * Listing order is registration order.
 */
class ToolRegistry {
public:
    struct Entry {
        ToolDescriptor descriptor;
        ToolHandler handler;
    };

    /**
     * @return false if a tool with the same name already exists
     */
    bool register_tool(ToolDescriptor descriptor, ToolHandler handler);

    [[nodiscard]] const Entry* find(std::string_view name) const;

    [[nodiscard]] size_t size() const { return entries_.size(); }

    /**
     * @brief JSON array of {name, description, inputSchema}
     */
    [[nodiscard]] std::string list_json() const;

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace sqlgate
