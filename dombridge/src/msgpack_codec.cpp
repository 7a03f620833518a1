#include "msgpack_codec.hpp"

#include <stdexcept>

namespace dombridge::codec {

Request decode_request(const std::string& bytes) {
    Request req;
    req.handle = msgpack::unpack(bytes.data(), bytes.size());
    msgpack::object root = req.handle.get();

    if (root.type != msgpack::type::MAP) {
        throw std::runtime_error("request is not a map");
    }
    if (auto id_obj = find_key(root, "id")) {
        req.id = as_string(*id_obj, "");
    }
    if (auto action_obj = find_key(root, "action")) {
        req.action = as_string(*action_obj, "");
    }
    if (auto payload_ptr = find_key(root, "payload")) {
        req.payload = *payload_ptr;
        req.has_payload = true;
    }

    return req;
}

const msgpack::object* find_key(const msgpack::object& map_obj, const std::string& key) {
    if (map_obj.type != msgpack::type::MAP) {
        return nullptr;
    }

    auto map = map_obj.via.map;
    for (uint32_t i = 0; i < map.size; ++i) {
        if (map.ptr[i].key.type == msgpack::type::STR) {
            std::string k(map.ptr[i].key.via.str.ptr, map.ptr[i].key.via.str.size);
            if (k == key) {
                return &map.ptr[i].val;
            }
        }
    }
    return nullptr;
}

std::string as_string(const msgpack::object& obj, const std::string& fallback) {
    if (obj.type == msgpack::type::STR) {
        return std::string(obj.via.str.ptr, obj.via.str.size);
    }
    return fallback;
}

int64_t as_int64(const msgpack::object& obj, int64_t fallback) {
    if (obj.type == msgpack::type::POSITIVE_INTEGER) {
        return static_cast<int64_t>(obj.via.u64);
    }
    if (obj.type == msgpack::type::NEGATIVE_INTEGER) {
        return static_cast<int64_t>(obj.via.i64);
    }
    return fallback;
}

nlohmann::json to_json(const msgpack::object& obj) {
    switch (obj.type) {
        case msgpack::type::NIL:
            return nullptr;
        case msgpack::type::BOOLEAN:
            return obj.via.boolean;
        case msgpack::type::POSITIVE_INTEGER:
            return obj.via.u64;
        case msgpack::type::NEGATIVE_INTEGER:
            return obj.via.i64;
        case msgpack::type::FLOAT32:
        case msgpack::type::FLOAT64:
            return obj.via.f64;
        case msgpack::type::STR:
            return std::string(obj.via.str.ptr, obj.via.str.size);
        case msgpack::type::BIN:
            return std::string(obj.via.bin.ptr, obj.via.bin.size);
        case msgpack::type::ARRAY: {
            nlohmann::json array = nlohmann::json::array();
            for (uint32_t i = 0; i < obj.via.array.size; ++i) {
                array.push_back(to_json(obj.via.array.ptr[i]));
            }
            return array;
        }
        case msgpack::type::MAP: {
            nlohmann::json object = nlohmann::json::object();
            for (uint32_t i = 0; i < obj.via.map.size; ++i) {
                const auto& kv = obj.via.map.ptr[i];
                if (kv.key.type != msgpack::type::STR) {
                    continue;
                }
                object[std::string(kv.key.via.str.ptr, kv.key.via.str.size)] = to_json(kv.val);
            }
            return object;
        }
        default:
            return nullptr;
    }
}

void pack_json(msgpack::packer<msgpack::sbuffer>& pk, const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            pk.pack_nil();
            break;
        case nlohmann::json::value_t::boolean:
            pk.pack(value.get<bool>());
            break;
        case nlohmann::json::value_t::number_unsigned:
            pk.pack(value.get<uint64_t>());
            break;
        case nlohmann::json::value_t::number_integer:
            pk.pack(value.get<int64_t>());
            break;
        case nlohmann::json::value_t::number_float:
            pk.pack(value.get<double>());
            break;
        case nlohmann::json::value_t::string:
            pk.pack(value.get_ref<const std::string&>());
            break;
        case nlohmann::json::value_t::array:
            pk.pack_array(static_cast<uint32_t>(value.size()));
            for (const auto& item : value) {
                pack_json(pk, item);
            }
            break;
        case nlohmann::json::value_t::object:
            pk.pack_map(static_cast<uint32_t>(value.size()));
            for (auto it = value.begin(); it != value.end(); ++it) {
                pk.pack(it.key());
                pack_json(pk, it.value());
            }
            break;
        default:
            pk.pack_nil();
            break;
    }
}

void pack_error(msgpack::packer<msgpack::sbuffer>& pk, const std::string& message) {
    pk.pack_map(1);
    pk.pack("message");
    pk.pack(message);
}

} // namespace dombridge::codec
