#include "server/stdio_transport.hpp"
#include "core/utils.hpp"

#include <format>
#include <string>

namespace sqlgate {

StdioTransport::StdioTransport(std::shared_ptr<const McpDispatcher> dispatcher,
                               std::istream& in, std::ostream& out)
    : dispatcher_(std::move(dispatcher)), in_(in), out_(out) {}

size_t StdioTransport::run() {
    utils::log::info("Serving MCP on stdio");

    size_t handled = 0;
    std::string line;
    while (!stop_requested_.load(std::memory_order_acquire) && std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (utils::trim(line).empty()) {
            continue;
        }

        ++handled;
        if (const auto response = dispatcher_->handle(line)) {
            out_ << *response << '\n';
            out_.flush();
            if (!out_) {
                utils::log::error("stdout closed, stopping stdio transport");
                break;
            }
        }
    }

    utils::log::info(std::format("stdio transport finished after {} message(s)", handled));
    return handled;
}

} // namespace sqlgate
