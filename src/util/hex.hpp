#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "util/secure_buffer.hpp"

namespace s33d::util {

std::string HexEncode(std::span<const std::uint8_t> data);

// Lowercase hex for secret bytes (entropy, seed); the text is wiped with
// the returned object.
SecureString HexEncodeSecret(std::span<const std::uint8_t> data);

bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out);

}  // namespace s33d::util
