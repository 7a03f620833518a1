#pragma once

#include <msgpack.hpp>
#include <nlohmann/json.hpp>

#include <string>

namespace dombridge::codec {

struct Request {
    std::string id;
    std::string action;
    msgpack::object payload;
    bool has_payload = false;
    msgpack::object_handle handle;
};

Request decode_request(const std::string& bytes);

const msgpack::object* find_key(const msgpack::object& map_obj, const std::string& key);
std::string as_string(const msgpack::object& obj, const std::string& fallback = "");
int64_t as_int64(const msgpack::object& obj, int64_t fallback = 0);

/// Converts a decoded msgpack value to JSON. Non-string map keys are skipped.
nlohmann::json to_json(const msgpack::object& obj);
void pack_json(msgpack::packer<msgpack::sbuffer>& pk, const nlohmann::json& value);

void pack_error(msgpack::packer<msgpack::sbuffer>& pk, const std::string& message);

} // namespace dombridge::codec
