#include "test_helpers.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <unistd.h>

#include <atomic>
#include <fstream>
#include <iterator>
#include <mutex>
#include <stdexcept>

std::string encode_action(const std::string& command, const PackFn& pack_payload) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);

    pk.pack_map(pack_payload ? 3 : 2);
    pk.pack("type");
    pk.pack("action");
    pk.pack("action");
    pk.pack(command);
    if (pack_payload) {
        pk.pack("payload");
        pack_payload(pk);
    }
    return std::string(buffer.data(), buffer.size());
}

PackFn string_fields(const std::vector<std::pair<std::string, std::string>>& fields) {
    return [fields](msgpack::packer<msgpack::sbuffer>& pk) {
        pk.pack_map(static_cast<uint32_t>(fields.size()));
        for (const auto& [key, value] : fields) {
            pk.pack(key);
            pk.pack(value);
        }
    };
}

std::string RecordedResponse::string_field(const std::string& key) const {
    const msgpack::object* obj = flitify::codec::find_key(payload(), key);
    return obj ? flitify::codec::as_string(*obj, "") : "";
}

int64_t RecordedResponse::int_field(const std::string& key, int64_t fallback) const {
    const msgpack::object* obj = flitify::codec::find_key(payload(), key);
    return obj ? flitify::codec::as_int64(*obj, fallback) : fallback;
}

bool RecordedResponse::has_field(const std::string& key) const {
    return flitify::codec::find_key(payload(), key) != nullptr;
}

uint32_t RecordedResponse::field_count() const {
    return payload().type == msgpack::type::MAP ? payload().via.map.size : 0;
}

void FakeTransport::push(const std::string& command, const PackFn& pack_payload) {
    pending_.push_back(encode_action(command, pack_payload));
}

void FakeTransport::push_raw(const std::string& frame) {
    pending_.push_back(frame);
}

std::optional<flitify::codec::Action> FakeTransport::receive_action() {
    if (pending_.empty()) {
        connected_ = false;
        return std::nullopt;
    }
    std::string frame = std::move(pending_.front());
    pending_.pop_front();
    try {
        return flitify::codec::decode_action(frame);
    } catch (const std::exception&) {
        return flitify::codec::Action{};
    }
}

void FakeTransport::send_response(const std::string& type, const msgpack::sbuffer& payload) {
    // Go through the real framing so tests see what the controller would
    std::string body = flitify::codec::encode_response(type, payload);
    auto handle = msgpack::unpack(body.data(), body.size());
    const msgpack::object* payload_obj = flitify::codec::find_key(handle.get(), "payload");
    if (!payload_obj) {
        throw std::logic_error("response without payload");
    }

    msgpack::sbuffer copy;
    msgpack::packer<msgpack::sbuffer> pk(&copy);
    pk.pack(*payload_obj);
    responses.push_back({type, msgpack::unpack(copy.data(), copy.size())});
}

flitify::StatusMap FakeSystemAgent::get_status() {
    if (fail_status) {
        throw std::runtime_error("status unavailable");
    }
    return {
        {"hostname", std::string("test-host")},
        {"cpu_count", int64_t{4}},
        {"load_1", 0.25},
        {"virtualized", true},
    };
}

std::vector<flitify::DirEntry> FakeSystemAgent::list_directory(const std::string& path) {
    listed_paths.push_back(path);
    if (path == "/nonexistent") {
        throw flitify::NotFoundError(path);
    }
    if (path == "/forbidden") {
        throw std::runtime_error("permission denied");
    }
    return {
        {"bin", "dir", 0, 1700000000},
        {"notes.txt", "file", 12, 1700000100},
    };
}

TempDir::TempDir() {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("flitify_agent_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

void write_bytes(const std::filesystem::path& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

std::string read_bytes(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void init_test_logging() {
    static std::once_flag once;
    std::call_once(once, []() { init_logging(FLITIFY_TEST_LOG_CONFIG); });
}
