#include "command.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <random>

namespace dombridge {

namespace {

constexpr std::array<const char*, kCommandSourceCount> kSourceNames = {"ui", "mcp"};

std::mt19937_64& rng() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    return gen;
}

std::string format_time(const char* fmt, bool utc) {
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    if (utc) {
        gmtime_r(&tt, &tm);
    } else {
        localtime_r(&tt, &tm);
    }
    char buffer[32] = {0};
    std::strftime(buffer, sizeof(buffer), fmt, &tm);
    return buffer;
}

} // namespace

const char* to_string(CommandSource source) {
    return kSourceNames[static_cast<std::size_t>(source)];
}

std::optional<CommandSource> parse_source(const std::string& text) {
    for (std::size_t i = 0; i < kSourceNames.size(); ++i) {
        if (text == kSourceNames[i]) {
            return static_cast<CommandSource>(i);
        }
    }
    return std::nullopt;
}

nlohmann::json encode_command(const Command& command) {
    nlohmann::json out = nlohmann::json::object();
    out["type"] = "dom_operation";
    out["action"] = command.action;
    if (command.arguments.is_object()) {
        for (auto it = command.arguments.begin(); it != command.arguments.end(); ++it) {
            if (it.key() == "type" || it.key() == "action" || it.key() == "request_id" || it.key() == "source") {
                continue;
            }
            out[it.key()] = it.value();
        }
    }
    out["request_id"] = command.request_id;
    out["source"] = to_string(command.source);
    return out;
}

std::string mint_request_id() {
    std::uniform_int_distribution<std::uint64_t> dist;
    std::uint64_t hi = dist(rng());
    std::uint64_t lo = dist(rng());

    // version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    static constexpr char kHex[] = "0123456789abcdef";
    std::string id;
    id.reserve(36);
    for (int i = 15; i >= 0; --i) {
        std::uint64_t word = i >= 8 ? hi : lo;
        int shift = (i % 8) * 8;
        auto byte = static_cast<unsigned>((word >> shift) & 0xFF);
        id.push_back(kHex[byte >> 4]);
        id.push_back(kHex[byte & 0x0F]);
        std::size_t emitted = 16 - static_cast<std::size_t>(i);
        if (emitted == 4 || emitted == 6 || emitted == 8 || emitted == 10) {
            id.push_back('-');
        }
    }
    return id;
}

std::string now_timestamp() {
    return format_time("%Y-%m-%d %H:%M:%S", false);
}

std::string now_iso() {
    return format_time("%Y-%m-%dT%H:%M:%SZ", true);
}

std::string result_request_id(const nlohmann::json& envelope) {
    if (!envelope.is_object()) {
        return "";
    }
    auto command = envelope.find("command");
    if (command != envelope.end() && command->is_object()) {
        auto id = command->find("request_id");
        if (id != command->end() && id->is_string()) {
            return id->get<std::string>();
        }
    }
    auto id = envelope.find("request_id");
    if (id != envelope.end() && id->is_string()) {
        return id->get<std::string>();
    }
    return "";
}

std::optional<CommandSource> result_source(const nlohmann::json& envelope) {
    if (!envelope.is_object()) {
        return std::nullopt;
    }
    auto command = envelope.find("command");
    if (command == envelope.end() || !command->is_object()) {
        return std::nullopt;
    }
    auto source = command->find("source");
    if (source == command->end() || !source->is_string()) {
        return std::nullopt;
    }
    return parse_source(source->get<std::string>());
}

const nlohmann::json& result_body(const nlohmann::json& envelope) {
    if (envelope.is_object()) {
        auto result = envelope.find("result");
        if (result != envelope.end() && result->is_object()) {
            return *result;
        }
    }
    return envelope;
}

} // namespace dombridge
