#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace s33d::crypto {

using Sha256Hash = std::array<std::uint8_t, 32>;

// FIPS 180-4 SHA-256 (liboqs backend). BIP39 takes its checksum bits from
// the front of this digest.
Sha256Hash Sha256(std::span<const std::uint8_t> data);

}  // namespace s33d::crypto
