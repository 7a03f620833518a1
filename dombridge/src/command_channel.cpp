#include "command_channel.hpp"

#include "command.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace dombridge {

namespace {

std::string string_field(const nlohmann::json& object, const char* key, const std::string& fallback) {
    if (!object.is_object()) {
        return fallback;
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

std::string make_reply(nlohmann::json reply) {
    reply["timestamp"] = now_timestamp();
    return reply.dump();
}

} // namespace

CommandChannel::CommandChannel(std::string host, uint16_t port)
    : host_(std::move(host)), port_(port) {
    server_.clear_access_channels(websocketpp::log::alevel::all);
    server_.set_error_channels(websocketpp::log::elevel::rerror | websocketpp::log::elevel::fatal);

    server_.init_asio();
    server_.set_reuse_addr(true);

    server_.set_open_handler([this](connection_hdl hdl) { on_open(hdl); });
    server_.set_close_handler([this](connection_hdl hdl) { on_close(hdl); });
    server_.set_fail_handler([this](connection_hdl hdl) { on_fail(hdl); });
    server_.set_message_handler([this](connection_hdl hdl, message_ptr msg) { on_message(hdl, msg); });
    server_.set_pong_timeout_handler([this](connection_hdl hdl, std::string) { on_pong_timeout(hdl); });
}

void CommandChannel::set_keepalive(std::chrono::milliseconds ping_interval, std::chrono::milliseconds pong_timeout) {
    ping_interval_ = ping_interval;
    pong_timeout_ = pong_timeout;
}

CommandChannel::~CommandChannel() {
    stop();
}

void CommandChannel::on_result(ResultHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    result_handler_ = std::move(handler);
}

bool CommandChannel::start() {
    if (running_) {
        return true;
    }

    websocketpp::lib::error_code ec;
    server_.listen(host_, std::to_string(port_), ec);
    if (ec) {
        LOG4CPLUS_ERROR(channel_logger(), "listen on " << host_ << ":" << port_ << " failed: " << ec.message());
        return false;
    }

    // Port 0 asks the OS for a free port; report the one actually bound.
    websocketpp::lib::asio::error_code endpoint_ec;
    auto local = server_.get_local_endpoint(endpoint_ec);
    if (!endpoint_ec) {
        port_ = local.port();
    }
    server_.set_pong_timeout(static_cast<long>(pong_timeout_.count()));

    server_.start_accept(ec);
    if (ec) {
        LOG4CPLUS_ERROR(channel_logger(), "start_accept failed: " << ec.message());
        websocketpp::lib::error_code ignored;
        server_.stop_listening(ignored);
        return false;
    }

    running_ = true;
    schedule_ping();
    io_thread_ = std::thread([this] {
        try {
            server_.run();
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(channel_logger(), "WebSocket loop error: " << exc.what());
        }
        running_ = false;
    });

    LOG4CPLUS_INFO(channel_logger(), "WebSocket server started on ws://" << host_ << ":" << port_);
    return true;
}

void CommandChannel::stop() {
    if (!io_thread_.joinable()) {
        return;
    }

    websocketpp::lib::error_code ec;
    server_.stop_listening(ec);

    std::set<connection_hdl, std::owner_less<connection_hdl>> clients;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients.swap(clients_);
    }
    for (const auto& hdl : clients) {
        websocketpp::lib::error_code close_ec;
        server_.close(hdl, websocketpp::close::status::going_away, "Server shutting down", close_ec);
    }

    server_.stop();
    io_thread_.join();
    running_ = false;
    LOG4CPLUS_INFO(channel_logger(), "WebSocket server stopped");
}

bool CommandChannel::broadcast(const nlohmann::json& command) {
    std::vector<connection_hdl> targets;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        targets.assign(clients_.begin(), clients_.end());
    }
    if (targets.empty()) {
        LOG4CPLUS_WARN(channel_logger(), "No extension clients connected, dropping " << string_field(command, "action", "command"));
        return false;
    }

    const std::string payload = command.dump();
    std::size_t delivered = 0;
    for (const auto& hdl : targets) {
        if (send_text(hdl, payload)) {
            ++delivered;
        } else {
            remove_client(hdl);
        }
    }

    LOG4CPLUS_DEBUG(channel_logger(), "Broadcast " << string_field(command, "action", "command") << " to " << delivered << "/"
                                      << targets.size() << " clients");
    return delivered > 0;
}

std::size_t CommandChannel::client_count() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return clients_.size();
}

std::vector<std::string> CommandChannel::handle_text(const std::string& text) {
    std::vector<std::string> replies;

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& exc) {
        LOG4CPLUS_WARN(channel_logger(), "Invalid JSON from extension: " << exc.what());
        replies.push_back(make_reply({{"type", "error"}, {"message", std::string("Invalid JSON: ") + exc.what()}}));
        return replies;
    }

    std::string type = "unknown";
    if (message.is_object()) {
        auto it = message.find("type");
        if (it != message.end() && it->is_string()) {
            type = it->get<std::string>();
        }
    }
    LOG4CPLUS_DEBUG(channel_logger(), "Received: " << type);

    try {
        if (type == "dom_operation_result") {
            ResultHandler handler;
            {
                std::lock_guard<std::mutex> lock(handler_mutex_);
                handler = result_handler_;
            }
            if (handler) {
                handler(message);
            } else {
                LOG4CPLUS_WARN(channel_logger(), "Result received with no handler installed");
            }
        } else if (type == "heartbeat") {
            replies.push_back(make_reply({{"type", "heartbeat_response"}}));
        } else if (type == "status_request") {
            replies.push_back(make_reply({{"type", "status_response"},
                                          {"status", "running"},
                                          {"connected_clients", client_count()}}));
        } else if (type == "tab_updated" || type == "tab_activated") {
            LOG4CPLUS_INFO(channel_logger(), type << ": " << string_field(message, "url", "Unknown URL"));
        }
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(channel_logger(), "Error handling " << type << " message: " << exc.what());
    }

    replies.push_back(make_reply({{"type", "message_received"}, {"original_type", type}}));
    return replies;
}

void CommandChannel::on_open(connection_hdl hdl) {
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients_.insert(hdl);
    }
    LOG4CPLUS_INFO(channel_logger(), "Client connected from " << remote_of(hdl) << " (" << client_count() << " total)");

    send_text(hdl, make_reply({{"type", "connection_established"},
                               {"message", "Connected to dombridge command channel"}}));
}

void CommandChannel::on_close(connection_hdl hdl) {
    remove_client(hdl);
    LOG4CPLUS_INFO(channel_logger(), "Client disconnected (" << client_count() << " remaining)");
}

void CommandChannel::on_fail(connection_hdl hdl) {
    remove_client(hdl);
    LOG4CPLUS_WARN(channel_logger(), "Connection from " << remote_of(hdl) << " failed");
}

void CommandChannel::on_message(connection_hdl hdl, message_ptr msg) {
    if (msg->get_opcode() != websocketpp::frame::opcode::text) {
        LOG4CPLUS_DEBUG(channel_logger(), "Ignoring non-text frame");
        return;
    }
    for (const auto& reply : handle_text(msg->get_payload())) {
        if (!send_text(hdl, reply)) {
            remove_client(hdl);
            return;
        }
    }
}

void CommandChannel::schedule_ping() {
    if (ping_interval_ <= std::chrono::milliseconds::zero()) {
        return;
    }
    server_.set_timer(static_cast<long>(ping_interval_.count()), [this](const websocketpp::lib::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        ping_clients();
        schedule_ping();
    });
}

void CommandChannel::ping_clients() {
    std::vector<connection_hdl> targets;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        targets.assign(clients_.begin(), clients_.end());
    }
    for (const auto& hdl : targets) {
        websocketpp::lib::error_code ec;
        server_.ping(hdl, "", ec);
        if (ec) {
            LOG4CPLUS_WARN(channel_logger(), "Ping failed: " << ec.message());
            remove_client(hdl);
        }
    }
}

void CommandChannel::on_pong_timeout(connection_hdl hdl) {
    LOG4CPLUS_WARN(channel_logger(), "No pong from " << remote_of(hdl) << ", dropping client");
    remove_client(hdl);
    websocketpp::lib::error_code ec;
    server_.close(hdl, websocketpp::close::status::policy_violation, "Pong timeout", ec);
}

bool CommandChannel::send_text(connection_hdl hdl, const std::string& text) {
    websocketpp::lib::error_code ec;
    server_.send(hdl, text, websocketpp::frame::opcode::text, ec);
    if (ec) {
        LOG4CPLUS_WARN(channel_logger(), "Send failed: " << ec.message());
        return false;
    }
    return true;
}

void CommandChannel::remove_client(connection_hdl hdl) {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    clients_.erase(hdl);
}

std::string CommandChannel::remote_of(connection_hdl hdl) {
    websocketpp::lib::error_code ec;
    auto con = server_.get_con_from_hdl(hdl, ec);
    if (ec || !con) {
        return "unknown";
    }
    return con->get_remote_endpoint();
}

} // namespace dombridge
