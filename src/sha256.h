#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace strata {

using sha256_t = std::array<unsigned char, 32>;

sha256_t sha256(void const *data, std::size_t length);

inline sha256_t sha256(std::string_view text) { return sha256(text.data(), text.size()); }

// Lowercase hex digest of text
std::string sha256_hex(std::string_view text);

}  // namespace strata
