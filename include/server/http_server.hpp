#pragma once

#include "server/mcp_dispatcher.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace sqlgate {

/**
 * @brief MCP over HTTP
 *
 * POST <mcp_path> carries one JSON-RPC message per request; the response
 * body is the JSON-RPC response, or 202 with no body for notifications.
 * GET /health reports liveness and the number of live handles.
 *
 * Requests run on an httplib::ThreadPool so a slow database behind one
 * handle never blocks calls on another.
 */
class HttpServer {
public:
    struct Config {
        std::string host = "127.0.0.1";
        int port = 8080;
        size_t threads = 8;
        std::string mcp_path = "/mcp";
    };

    using ConnectionCounter = std::function<size_t()>;

    HttpServer(std::shared_ptr<const McpDispatcher> dispatcher,
               Config config,
               ConnectionCounter live_connections);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind and serve until stop() (blocking)
     * @throws std::runtime_error if the address cannot be bound
     */
    void start();

    /**
     * @brief Unblock start(); safe from any thread, repeatable
     */
    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(std::memory_order_acquire); }

private:
    void register_routes(httplib::Server& svr);
    void handle_mcp(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);

    std::shared_ptr<const McpDispatcher> dispatcher_;
    const Config config_;
    ConnectionCounter live_connections_;

    std::mutex server_mutex_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    bool stop_requested_ = false;     // guarded by server_mutex_
};

} // namespace sqlgate
