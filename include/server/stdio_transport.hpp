#pragma once

#include "server/mcp_dispatcher.hpp"
#include <atomic>
#include <istream>
#include <memory>
#include <ostream>

namespace sqlgate {

/**
 * @brief MCP over stdio: one JSON-RPC message per input line
 *
 * Each response is written as a single line and flushed. Blank lines are
 * skipped. Logging must stay on stderr while this transport owns stdout.
 */
class StdioTransport {
public:
    StdioTransport(std::shared_ptr<const McpDispatcher> dispatcher,
                   std::istream& in, std::ostream& out);

    /**
     * @brief Serve until end of input or stop()
     * @return Number of messages handled
     */
    size_t run();

    /**
     * @brief Stop after the message currently being handled
     */
    void stop() { stop_requested_.store(true, std::memory_order_release); }

private:
    std::shared_ptr<const McpDispatcher> dispatcher_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> stop_requested_{false};
};

} // namespace sqlgate
