#include "msgpack_codec.hpp"

#include <sstream>
#include <stdexcept>

namespace flitify::codec {

Action decode_action(const std::string& bytes) {
    Action action;
    action.handle = msgpack::unpack(bytes.data(), bytes.size());
    msgpack::object root = action.handle.get();

    if (root.type != msgpack::type::MAP) {
        throw std::invalid_argument("action frame is not a map");
    }
    if (auto action_obj = find_key(root, "action")) {
        action.command = as_string(*action_obj, "");
    }
    if (auto payload_ptr = find_key(root, "payload")) {
        if (payload_ptr->type == msgpack::type::MAP) {
            action.payload = *payload_ptr;
            action.has_payload = true;
        }
    }

    return action;
}

std::string encode_response(const std::string& type, const msgpack::sbuffer& payload) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);

    pk.pack_map(3);
    pk.pack("type");
    pk.pack("response");
    pk.pack("response");
    pk.pack(type);
    pk.pack("payload");
    if (payload.size() == 0) {
        pk.pack_map(0);
    } else {
        buffer.write(payload.data(), payload.size());
    }

    return std::string(buffer.data(), buffer.size());
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

double as_double(const msgpack::object& obj, double fallback) {
    if (obj.type == msgpack::type::FLOAT32 || obj.type == msgpack::type::FLOAT64) {
        return obj.via.f64;
    }
    if (obj.type == msgpack::type::POSITIVE_INTEGER) {
        return static_cast<double>(obj.via.u64);
    }
    if (obj.type == msgpack::type::NEGATIVE_INTEGER) {
        return static_cast<double>(obj.via.i64);
    }
    return fallback;
}

bool is_number(const msgpack::object& obj) {
    switch (obj.type) {
        case msgpack::type::POSITIVE_INTEGER:
        case msgpack::type::NEGATIVE_INTEGER:
        case msgpack::type::FLOAT32:
        case msgpack::type::FLOAT64:
            return true;
        default:
            return false;
    }
}

std::string as_text(const msgpack::object& obj) {
    switch (obj.type) {
        case msgpack::type::STR:
            return as_string(obj);
        case msgpack::type::NIL:
            return "";
        default: {
            std::ostringstream out;
            out << obj;
            return out.str();
        }
    }
}

void pack_value(msgpack::packer<msgpack::sbuffer>& pk, const Value& value) {
    std::visit([&pk](const auto& v) { pk.pack(v); }, value);
}

void pack_status_map(msgpack::packer<msgpack::sbuffer>& pk, const StatusMap& status) {
    pk.pack_map(static_cast<uint32_t>(status.size()));
    for (const auto& [key, value] : status) {
        pk.pack(key);
        pack_value(pk, value);
    }
}

void pack_entries(msgpack::packer<msgpack::sbuffer>& pk, const std::vector<DirEntry>& entries) {
    pk.pack_array(static_cast<uint32_t>(entries.size()));
    for (const auto& entry : entries) {
        pk.pack_map(4);
        pk.pack("name");
        pk.pack(entry.name);
        pk.pack("type");
        pk.pack(entry.type);
        pk.pack("size");
        pk.pack(entry.size);
        pk.pack("modified");
        pk.pack(entry.modified);
    }
}

} // namespace flitify::codec
