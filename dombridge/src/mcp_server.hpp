#pragma once

#include "credentials.hpp"
#include "sse_hub.hpp"
#include "tool_dispatcher.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace dombridge::mcp {

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kServerError = -32000;

constexpr const char* kProtocolVersion = "2024-11-05";
constexpr const char* kServerName = "llmcp-browser-automation";

nlohmann::json make_error(const nlohmann::json& id, int code, const std::string& message);

struct HttpReply {
    int status = 200;
    std::string body;  // empty for 204
};

/**
 * JSON-RPC method surface of the tool server.
 *
 * Transport independent: the HTTP layer hands it parsed request objects.
 * Tool failures come back as isError content, never as protocol errors,
 * unless the tool name itself is unknown.
 */
class RequestHandler {
public:
    RequestHandler(ToolDispatcher& dispatcher, SseHub& sse);

    /// nullopt for notifications.
    std::optional<nlohmann::json> handle(const nlohmann::json& request);

    /// Parses body and maps the outcome onto an HTTP status.
    HttpReply handle_body(const std::string& body);

private:
    nlohmann::json handle_tools_call(const nlohmann::json& id, const nlohmann::json& params);

    ToolDispatcher& dispatcher_;
    SseHub& sse_;
};

struct ServerConfig {
    std::string host = "localhost";
    int port = 11809;  // 0 binds a free port
    std::size_t worker_threads = 16;
    // Each open monitoring stream holds one worker; keep this below worker_threads.
    std::size_t max_sse_streams = 8;
    std::chrono::milliseconds keepalive{30000};
};

/// HTTP transport: message endpoint, monitoring stream and health check.
class HttpServer {
public:
    HttpServer(ServerConfig config, RequestHandler& handler, ToolDispatcher& dispatcher, SseHub& sse,
               const CredentialProvider* credentials = nullptr);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }
    bool tls_enabled() const { return tls_enabled_; }
    /// Bound port once start() succeeded.
    int port() const { return bound_port_; }

    nlohmann::json health() const;

private:
    bool create_server();
    void install_routes();

    ServerConfig config_;
    RequestHandler& handler_;
    ToolDispatcher& dispatcher_;
    SseHub& sse_;
    const CredentialProvider* credentials_;

    std::unique_ptr<httplib::Server> server_;
    std::thread listen_thread_;
    std::atomic<bool> running_{false};
    bool tls_enabled_ = false;
    int bound_port_ = 0;
};

} // namespace dombridge::mcp
