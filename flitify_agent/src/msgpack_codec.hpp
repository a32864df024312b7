#pragma once

#include "protocol.hpp"

#include <msgpack.hpp>

#include <string>
#include <vector>

namespace flitify::codec {

/// One decoded inbound frame. `payload` points into `handle`.
struct Action {
    std::string command;
    msgpack::object payload;
    bool has_payload = false;
    msgpack::object_handle handle;
};

Action decode_action(const std::string& bytes);

/// Wrap an already packed payload map into a response frame body
std::string encode_response(const std::string& type, const msgpack::sbuffer& payload);

const msgpack::object* find_key(const msgpack::object& map_obj, const std::string& key);
std::string as_string(const msgpack::object& obj, const std::string& fallback = "");
int64_t as_int64(const msgpack::object& obj, int64_t fallback = 0);
double as_double(const msgpack::object& obj, double fallback = 0.0);
bool is_number(const msgpack::object& obj);
/// Strings verbatim, other values in msgpack's text form, nil as ""
std::string as_text(const msgpack::object& obj);

void pack_value(msgpack::packer<msgpack::sbuffer>& pk, const Value& value);
void pack_status_map(msgpack::packer<msgpack::sbuffer>& pk, const StatusMap& status);
void pack_entries(msgpack::packer<msgpack::sbuffer>& pk, const std::vector<DirEntry>& entries);

} // namespace flitify::codec
