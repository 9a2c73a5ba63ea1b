#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace quarry {

using blake3_t = std::array<unsigned char, 32>;
blake3_t blake3_hash(void const *data, size_t length);

// Short lowercase hex key for naming cache directories after arbitrary text.
std::string blake3_key(std::string_view text, size_t hex_chars = 16);

}  // namespace quarry
