#include "crypto/hash.hpp"

#include <oqs/sha2.h>

namespace s33d::crypto {

Sha256Hash Sha256(std::span<const std::uint8_t> data) {
  Sha256Hash out{};
  OQS_SHA2_sha256(out.data(), data.data(), data.size());
  return out;
}

}  // namespace s33d::crypto
