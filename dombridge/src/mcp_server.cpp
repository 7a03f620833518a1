#include "mcp_server.hpp"

#include "command.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace dombridge::mcp {

namespace {

nlohmann::json make_result(const nlohmann::json& id, nlohmann::json result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

nlohmann::json text_content(const std::string& text) {
    return nlohmann::json::array({{{"type", "text"}, {"text", text}}});
}

std::string format_tool_result(const nlohmann::json& result) {
    nlohmann::json clean = result;
    if (clean.is_object()) {
        clean.erase("success");
    }
    if (clean.empty()) {
        return result.dump(2);
    }
    return clean.dump(2);
}

} // namespace

nlohmann::json make_error(const nlohmann::json& id, int code, const std::string& message) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

RequestHandler::RequestHandler(ToolDispatcher& dispatcher, SseHub& sse)
    : dispatcher_(dispatcher), sse_(sse) {}

std::optional<nlohmann::json> RequestHandler::handle(const nlohmann::json& request) {
    nlohmann::json id = nullptr;
    std::string method;
    if (request.is_object()) {
        auto id_it = request.find("id");
        if (id_it != request.end()) {
            id = *id_it;
        }
        auto method_it = request.find("method");
        if (method_it != request.end() && method_it->is_string()) {
            method = method_it->get<std::string>();
        }
    }

    sse_.publish({{"type", "request"}, {"method", method.empty() ? nlohmann::json(nullptr) : nlohmann::json(method)},
                  {"id", id}, {"timestamp", now_iso()}});

    if (method.empty()) {
        LOG4CPLUS_WARN(mcp_logger(), "Request without method");
        return make_error(id, kInvalidRequest, "Invalid Request");
    }

    LOG4CPLUS_INFO(mcp_logger(), "Client -> MCP method: " << method);

    if (method == "initialize") {
        LOG4CPLUS_INFO(mcp_logger(), "Initialized");
        return make_result(id, {
            {"protocolVersion", kProtocolVersion},
            {"capabilities", {{"tools", nlohmann::json::object()}}},
            {"serverInfo", {{"name", kServerName}, {"version", VERSION_STRING}}},
        });
    }

    if (method.rfind("notifications/", 0) == 0) {
        LOG4CPLUS_INFO(mcp_logger(), "Notification " << method << " acknowledged");
        return std::nullopt;
    }

    if (method == "tools/list") {
        nlohmann::json tools = dispatcher_.catalog().to_json();
        LOG4CPLUS_INFO(mcp_logger(), "Listing " << tools.size() << " tools");
        return make_result(id, {{"tools", std::move(tools)}});
    }

    if (method == "resources/list") {
        return make_result(id, {{"resources", nlohmann::json::array()}});
    }

    if (method == "prompts/list") {
        return make_result(id, {{"prompts", nlohmann::json::array()}});
    }

    if (method == "tools/call") {
        auto params_it = request.find("params");
        nlohmann::json params = params_it != request.end() ? *params_it : nlohmann::json::object();
        return handle_tools_call(id, params);
    }

    LOG4CPLUS_WARN(mcp_logger(), "Method not found: " << method);
    return make_error(id, kMethodNotFound, "Method not found: " + method);
}

nlohmann::json RequestHandler::handle_tools_call(const nlohmann::json& id, const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return make_error(id, kInvalidParams, "Invalid params: tool name is required");
    }

    const std::string tool_name = params["name"].get<std::string>();
    nlohmann::json arguments = params.value("arguments", nlohmann::json::object());

    LOG4CPLUS_INFO(mcp_logger(), "Calling tool: " << tool_name);
    ToolOutcome outcome = dispatcher_.call(tool_name, arguments);

    if (outcome.status == ToolStatus::UnknownTool) {
        return make_error(id, kInvalidParams, outcome.error);
    }

    if (!outcome.ok()) {
        LOG4CPLUS_WARN(mcp_logger(), "Tool " << tool_name << " failed (" << to_string(outcome.status) << "): "
                                     << outcome.error);
        return make_result(id, {{"content", text_content("Error: " + outcome.error)}, {"isError", true}});
    }

    LOG4CPLUS_INFO(mcp_logger(), "Tool result sent for " << tool_name);
    return make_result(id, {{"content", text_content(format_tool_result(outcome.result))}});
}

HttpReply RequestHandler::handle_body(const std::string& body) {
    HttpReply reply;

    nlohmann::json request;
    try {
        request = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& exc) {
        LOG4CPLUS_WARN(mcp_logger(), "Parse error: " << exc.what());
        reply.status = 400;
        reply.body = make_error(nullptr, kParseError, "Parse error").dump();
        return reply;
    }

    try {
        std::optional<nlohmann::json> response = handle(request);
        if (!response) {
            reply.status = 204;
            return reply;
        }
        reply.body = response->dump();
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(mcp_logger(), "Error handling message: " << exc.what());
        reply.status = 500;
        reply.body = make_error(nullptr, kServerError, exc.what()).dump();
    }
    return reply;
}

HttpServer::HttpServer(ServerConfig config, RequestHandler& handler, ToolDispatcher& dispatcher, SseHub& sse,
                       const CredentialProvider* credentials)
    : config_(std::move(config)),
      handler_(handler),
      dispatcher_(dispatcher),
      sse_(sse),
      credentials_(credentials) {}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::create_server() {
    tls_enabled_ = false;
    if (!credentials_) {
        server_ = std::make_unique<httplib::Server>();
        return true;
    }

    std::optional<TlsCredentials> tls = credentials_->credentials();
    if (!tls) {
        LOG4CPLUS_ERROR(mcp_logger(), "TLS requested but no credentials are available");
        return false;
    }

#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    auto server = std::make_unique<httplib::SSLServer>(tls->cert_file.c_str(), tls->key_file.c_str());
    if (!server->is_valid()) {
        LOG4CPLUS_ERROR(mcp_logger(), "Failed to load certificate " << tls->cert_file);
        return false;
    }
    LOG4CPLUS_INFO(mcp_logger(), "Loaded certificate: " << tls->cert_file);
    server_ = std::move(server);
    tls_enabled_ = true;
    return true;
#else
    LOG4CPLUS_ERROR(mcp_logger(), "TLS requested but this build has no OpenSSL support");
    return false;
#endif
}

void HttpServer::install_routes() {
    const std::size_t workers = config_.worker_threads;
    server_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };

    server_->set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Headers", "*"},
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
    });

    server_->Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    server_->Post("/mcp/v1/message", [this](const httplib::Request& req, httplib::Response& res) {
        HttpReply reply = handler_.handle_body(req.body);
        res.status = reply.status;
        if (reply.status != 204) {
            res.set_content(reply.body, "application/json");
        }
    });

    server_->Get("/mcp/v1/health", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(health().dump(), "application/json");
    });

    server_->Get("/mcp/v1/sse", [this](const httplib::Request&, httplib::Response& res) {
        auto subscriber = sse_.try_subscribe(config_.max_sse_streams);
        if (!subscriber) {
            LOG4CPLUS_WARN(mcp_logger(), "Rejecting SSE client: " << config_.max_sse_streams << " streams already open");
            res.status = 503;
            res.set_content(nlohmann::json({{"error", "Too many monitoring streams"}}).dump(), "application/json");
            return;
        }
        const auto keepalive = config_.keepalive;
        const std::string connected = std::string("event: connected\ndata: ") +
            nlohmann::json({{"connected", true}, {"protocol", tls_enabled_ ? "https" : "http"}}).dump() + "\n\n";

        res.set_header("Cache-Control", "no-cache");
        res.set_header("X-Accel-Buffering", "no");
        res.set_chunked_content_provider(
            "text/event-stream",
            [subscriber, keepalive, connected, greeted = false](size_t, httplib::DataSink& sink) mutable {
                if (!greeted) {
                    greeted = true;
                    return sink.write(connected.data(), connected.size());
                }

                std::string message;
                switch (subscriber->next(message, keepalive)) {
                    case SseSubscriber::Poll::Message: {
                        std::string event = "data: " + message + "\n\n";
                        return sink.write(event.data(), event.size());
                    }
                    case SseSubscriber::Poll::Timeout: {
                        static const std::string kKeepalive = ":keepalive\n\n";
                        return sink.write(kKeepalive.data(), kKeepalive.size());
                    }
                    case SseSubscriber::Poll::Closed:
                        break;
                }
                sink.done();
                return true;
            },
            [this, subscriber](bool) { sse_.unsubscribe(subscriber); });
    });
}

bool HttpServer::start() {
    if (running_) {
        return true;
    }
    if (!create_server()) {
        return false;
    }
    install_routes();

    if (config_.port == 0) {
        bound_port_ = server_->bind_to_any_port(config_.host);
    } else if (server_->bind_to_port(config_.host, config_.port)) {
        bound_port_ = config_.port;
    } else {
        bound_port_ = -1;
    }
    if (bound_port_ <= 0) {
        LOG4CPLUS_ERROR(mcp_logger(), "Failed to bind " << config_.host << ":" << config_.port);
        server_.reset();
        return false;
    }

    running_ = true;
    listen_thread_ = std::thread([this] {
        if (!server_->listen_after_bind()) {
            LOG4CPLUS_ERROR(mcp_logger(), "HTTP listener exited with an error");
        }
        running_ = false;
    });

    const char* scheme = tls_enabled_ ? "https" : "http";
    LOG4CPLUS_INFO(mcp_logger(), "MCP server started on " << scheme << "://" << config_.host << ":" << bound_port_);
    return true;
}

void HttpServer::stop() {
    if (!server_) {
        return;
    }
    LOG4CPLUS_INFO(mcp_logger(), "Stopping MCP server");
    sse_.close_all();
    server_->stop();
    if (listen_thread_.joinable()) {
        listen_thread_.join();
    }
    running_ = false;
    server_.reset();
}

nlohmann::json HttpServer::health() const {
    return {
        {"status", "healthy"},
        {"is_running", running_.load()},
        {"protocol", tls_enabled_ ? "https" : "http"},
        {"host", config_.host},
        {"port", bound_port_ > 0 ? bound_port_ : config_.port},
        {"clients_connected", sse_.subscriber_count()},
        {"extension_clients", dispatcher_.extension_clients()},
        {"requests_processed", dispatcher_.requests_processed()},
        {"pending_requests", dispatcher_.pending_requests()},
        {"available_tools", dispatcher_.catalog().size()},
        {"last_activity", dispatcher_.last_activity()},
        {"ssl_enabled", tls_enabled_},
    };
}

} // namespace dombridge::mcp
