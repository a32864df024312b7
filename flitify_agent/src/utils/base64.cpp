#include "base64.hpp"

#include <cstdint>
#include <stdexcept>

namespace flitify::utils {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decode_char(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

bool is_space(unsigned char c) {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

} // namespace

std::string base64_encode(const unsigned char* data, size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < len; i += 3) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
        out.push_back(kAlphabet[n & 0x3F]);
    }

    const size_t rest = len - i;
    if (rest == 1) {
        uint32_t n = uint32_t(data[i]) << 16;
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::vector<unsigned char> base64_decode(const std::string& s) {
    std::vector<unsigned char> out;
    out.reserve((s.size() / 4) * 3);

    uint32_t accum = 0;
    int quantum = 0;
    int padding = 0;

    for (unsigned char c : s) {
        if (is_space(c)) {
            continue;
        }
        if (c == '=') {
            // padding may only close the final quantum
            if (quantum < 2) {
                throw std::invalid_argument("base64: misplaced padding");
            }
            ++padding;
            ++quantum;
        } else {
            if (padding > 0) {
                throw std::invalid_argument("base64: data after padding");
            }
            int v = decode_char(c);
            if (v < 0) {
                throw std::invalid_argument("base64: invalid character");
            }
            accum = (accum << 6) | static_cast<uint32_t>(v);
            ++quantum;
        }

        if (quantum == 4) {
            if (padding == 0) {
                out.push_back(static_cast<unsigned char>((accum >> 16) & 0xFF));
                out.push_back(static_cast<unsigned char>((accum >> 8) & 0xFF));
                out.push_back(static_cast<unsigned char>(accum & 0xFF));
            } else if (padding == 1) {
                out.push_back(static_cast<unsigned char>((accum >> 10) & 0xFF));
                out.push_back(static_cast<unsigned char>((accum >> 2) & 0xFF));
            } else if (padding == 2) {
                out.push_back(static_cast<unsigned char>((accum >> 4) & 0xFF));
            } else {
                throw std::invalid_argument("base64: too much padding");
            }
            accum = 0;
            quantum = 0;
            if (padding > 0) {
                // only whitespace may follow a padded quantum
                padding = 3;
            }
        }
    }

    if (quantum != 0) {
        throw std::invalid_argument("base64: truncated input");
    }
    return out;
}

} // namespace flitify::utils
