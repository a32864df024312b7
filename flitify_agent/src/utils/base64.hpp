#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace flitify::utils {

std::string base64_encode(const unsigned char* data, size_t len);

/// Length of the padded encoding of `len` bytes
constexpr uint64_t base64_encoded_size(uint64_t len) { return 4 * ((len + 2) / 3); }

/// Standard alphabet with padding. Whitespace is skipped; any other
/// character outside the alphabet, or bad padding, throws std::invalid_argument.
std::vector<unsigned char> base64_decode(const std::string& s);

} // namespace flitify::utils
