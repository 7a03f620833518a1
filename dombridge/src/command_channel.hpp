#pragma once

#include <nlohmann/json.hpp>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace dombridge {

/// Outbound side of the extension channel, as seen by the dispatcher.
class CommandTransport {
public:
    virtual ~CommandTransport() = default;

    /// Sends command to every connected client. True if at least one send succeeded.
    virtual bool broadcast(const nlohmann::json& command) = 0;
    virtual std::size_t client_count() const = 0;
};

/**
 * WebSocket server the browser extension connects to.
 *
 * Holds no per-request state: commands are broadcast to the whole pool and
 * every dom_operation_result is handed to the result handler as-is.
 */
class CommandChannel final : public CommandTransport {
public:
    using ResultHandler = std::function<void(const nlohmann::json& envelope)>;

    static constexpr std::chrono::milliseconds kDefaultPingInterval{30000};
    static constexpr std::chrono::milliseconds kDefaultPongTimeout{10000};

    /// port 0 binds a free port; port() reports it once start() succeeded.
    CommandChannel(std::string host, uint16_t port);
    ~CommandChannel() override;

    CommandChannel(const CommandChannel&) = delete;
    CommandChannel& operator=(const CommandChannel&) = delete;

    void on_result(ResultHandler handler);

    /// Clients that miss a pong within pong_timeout are dropped. Call before start().
    void set_keepalive(std::chrono::milliseconds ping_interval, std::chrono::milliseconds pong_timeout);

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    bool broadcast(const nlohmann::json& command) override;
    std::size_t client_count() const override;

    /// Processes one inbound text frame and returns the replies owed to its sender.
    std::vector<std::string> handle_text(const std::string& text);

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

private:
    using ws_server = websocketpp::server<websocketpp::config::asio>;
    using connection_hdl = websocketpp::connection_hdl;
    using message_ptr = ws_server::message_ptr;

    void on_open(connection_hdl hdl);
    void on_close(connection_hdl hdl);
    void on_fail(connection_hdl hdl);
    void on_message(connection_hdl hdl, message_ptr msg);
    void on_pong_timeout(connection_hdl hdl);
    void schedule_ping();
    void ping_clients();

    bool send_text(connection_hdl hdl, const std::string& text);
    void remove_client(connection_hdl hdl);
    std::string remote_of(connection_hdl hdl);

    std::string host_;
    uint16_t port_;
    ws_server server_;
    std::chrono::milliseconds ping_interval_{kDefaultPingInterval};
    std::chrono::milliseconds pong_timeout_{kDefaultPongTimeout};
    std::thread io_thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex clients_mutex_;
    std::set<connection_hdl, std::owner_less<connection_hdl>> clients_;

    std::mutex handler_mutex_;
    ResultHandler result_handler_;
};

} // namespace dombridge
