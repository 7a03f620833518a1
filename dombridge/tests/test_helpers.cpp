#include "test_helpers.hpp"

#include "logger.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <mutex>
#include <random>

namespace {

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override {
        static std::once_flag once;
        std::call_once(once, []() { init_logging(DOMBRIDGE_TEST_LOG_CONFIG); });
    }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

} // namespace

bool FakeTransport::broadcast(const nlohmann::json& command) {
    if (clients_.load() == 0) {
        return false;
    }

    Responder responder;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.push_back(command);
        responder = responder_;
    }
    if (responder) {
        responder(command);
    }
    return true;
}

void FakeTransport::set_responder(Responder responder) {
    std::lock_guard<std::mutex> lock(mutex_);
    responder_ = std::move(responder);
}

std::vector<nlohmann::json> FakeTransport::sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
}

nlohmann::json FakeTransport::last_sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sent_.empty()) {
        return nullptr;
    }
    return sent_.back();
}

ScratchDir::ScratchDir() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<unsigned> dist;
    path_ = std::filesystem::temp_directory_path() / ("dombridge_test_" + std::to_string(dist(gen)));
    std::filesystem::create_directories(path_);
}

ScratchDir::~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

void write_text_file(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

nlohmann::json make_result(const std::string& request_id, const std::string& source, nlohmann::json result) {
    nlohmann::json command = nlohmann::json::object();
    if (!request_id.empty()) {
        command["request_id"] = request_id;
    }
    if (!source.empty()) {
        command["source"] = source;
    }
    return {{"type", "dom_operation_result"},
            {"command", command},
            {"result", std::move(result)},
            {"timestamp", "2026-01-01T00:00:00Z"}};
}

msgpack::object_handle make_payload(const std::function<void(msgpack::packer<msgpack::sbuffer>&)>& pack_fn) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);
    pack_fn(pk);
    return msgpack::unpack(buffer.data(), buffer.size());
}
