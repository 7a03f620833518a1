#pragma once

#include "command_channel.hpp"

#include <msgpack.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

/**
 * In-memory extension link. Records every broadcast command and can
 * answer it through on_broadcast, which runs on the caller's thread.
 */
class FakeTransport final : public dombridge::CommandTransport {
public:
    using Responder = std::function<void(const nlohmann::json& command)>;

    explicit FakeTransport(std::size_t clients = 1) : clients_(clients) {}

    bool broadcast(const nlohmann::json& command) override;
    std::size_t client_count() const override { return clients_.load(); }

    void set_clients(std::size_t clients) { clients_.store(clients); }
    void set_responder(Responder responder);

    std::vector<nlohmann::json> sent() const;
    nlohmann::json last_sent() const;

private:
    std::atomic<std::size_t> clients_;
    mutable std::mutex mutex_;
    std::vector<nlohmann::json> sent_;
    Responder responder_;
};

/// A fresh directory under the system temp path, removed on destruction.
class ScratchDir {
public:
    ScratchDir();
    ~ScratchDir();

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    std::filesystem::path file(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

void write_text_file(const std::filesystem::path& path, const std::string& text);

/// {type:"dom_operation_result", command:{request_id, source}, result, timestamp}
nlohmann::json make_result(const std::string& request_id, const std::string& source, nlohmann::json result);

msgpack::object_handle make_payload(const std::function<void(msgpack::packer<msgpack::sbuffer>&)>& pack_fn);
