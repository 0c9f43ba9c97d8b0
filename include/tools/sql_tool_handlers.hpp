#pragma once

#include "server/tool_registry.hpp"
#include "tools/sql_tool_service.hpp"
#include <memory>

namespace sqlgate {

/**
 * @brief Register every SqlToolService operation as an MCP tool
 *
 * Tool names and argument names follow the public tool surface
 * (createConnection, queryWithConnection, connectionId, sql, ...).
 * Handlers parse arguments, call the service and render JSON text.
 *
 * @return Number of tools registered
 */
size_t register_sql_tools(ToolRegistry& registry, std::shared_ptr<SqlToolService> service);

} // namespace sqlgate
