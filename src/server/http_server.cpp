#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <format>
#include <stdexcept>

namespace sqlgate {

HttpServer::HttpServer(std::shared_ptr<const McpDispatcher> dispatcher,
                       Config config,
                       ConnectionCounter live_connections)
    : dispatcher_(std::move(dispatcher)),
      config_(std::move(config)),
      live_connections_(std::move(live_connections)) {}

HttpServer::~HttpServer() {
    stop();
}

// ============================================================================
// start(): build the server, register routes, listen
// ============================================================================

void HttpServer::start() {
    httplib::Server* svr = nullptr;
    {
        std::lock_guard<std::mutex> lock(server_mutex_);
        if (stop_requested_) {
            return;
        }
        server_ = std::make_unique<httplib::Server>();
        svr = server_.get();
    }

    const size_t pool_size = config_.threads > 0 ? config_.threads : 1;
    svr->new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    register_routes(*svr);

    utils::log::info(std::format("Starting MCP HTTP server on {}:{}{} ({} threads)",
        config_.host, config_.port, config_.mcp_path, pool_size));

    running_.store(true, std::memory_order_release);
    const bool ok = svr->listen(config_.host, config_.port);
    running_.store(false, std::memory_order_release);

    if (!ok) {
        std::lock_guard<std::mutex> lock(server_mutex_);
        if (!stop_requested_) {
            throw std::runtime_error(std::format("Failed to bind HTTP server to {}:{}",
                config_.host, config_.port));
        }
    }
}

void HttpServer::stop() {
    std::lock_guard<std::mutex> lock(server_mutex_);
    if (stop_requested_) {
        return;
    }
    stop_requested_ = true;
    if (server_) {
        server_->stop();
        utils::log::info("HTTP server stopped");
    }
}

// ============================================================================
// Routes
// ============================================================================

void HttpServer::register_routes(httplib::Server& svr) {
    svr.Post(config_.mcp_path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_mcp(req, res);
    });
    svr.Get(http::kHealthPath, [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });

    svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                 std::exception_ptr ep) {
        std::string what = "unknown error";
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        }
        utils::log::error(std::format("Unhandled error on {} {}: {}", req.method, req.path, what));
        res.status = 500;
        res.set_content(McpDispatcher::make_error("null", rpc::INTERNAL_ERROR, "Internal error"),
                        http::kJsonContentType);
    });
}

void HttpServer::handle_mcp(const httplib::Request& req, httplib::Response& res) {
    const auto response = dispatcher_->handle(req.body);
    if (!response) {
        // Notification: accepted, nothing to return
        res.status = 202;
        return;
    }
    res.status = 200;
    res.set_content(*response, http::kJsonContentType);
}

void HttpServer::handle_health(const httplib::Request&, httplib::Response& res) {
    const size_t live = live_connections_ ? live_connections_() : 0;
    res.set_content(std::format(R"({{"status":"ok","connections":{}}})", live),
                    http::kJsonContentType);
}

} // namespace sqlgate
