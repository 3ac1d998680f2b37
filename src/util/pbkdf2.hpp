#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "util/secure_buffer.hpp"

namespace s33d::util {

// PBKDF2-HMAC-SHA512 (RFC 8018, section 5.2).
// - password: raw password bytes (callers pass NFKD-normalized UTF-8)
// - salt: arbitrary salt bytes
// - iterations: c >= 1
// - dk_len: length of derived key in bytes, >= 1
//
// Throws std::invalid_argument when iterations or dk_len is zero.
SecureBytes Pbkdf2HmacSha512(std::string_view password,
                             std::span<const std::uint8_t> salt,
                             std::uint32_t iterations,
                             std::size_t dk_len);

}  // namespace s33d::util
