#include "util/pbkdf2.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <vector>

#include <oqs/sha2.h>

namespace s33d::util {

namespace {

constexpr std::size_t kBlockSize = 128;
constexpr std::size_t kDigestSize = 64;

// HMAC-SHA512 keyed once; the password is the key for every PRF call of a
// derivation, so the padded key blocks are prepared up front.
class HmacSha512 {
 public:
  explicit HmacSha512(std::span<const std::uint8_t> key) {
    std::array<std::uint8_t, kBlockSize> key_block{};
    if (key.size() > kBlockSize) {
      OQS_SHA2_sha512(key_block.data(), key.data(), key.size());
    } else {
      std::copy(key.begin(), key.end(), key_block.begin());
    }
    for (std::size_t i = 0; i < kBlockSize; ++i) {
      inner_pad_[i] = static_cast<std::uint8_t>(key_block[i] ^ 0x36);
      outer_pad_[i] = static_cast<std::uint8_t>(key_block[i] ^ 0x5c);
    }
    SecureWipe(key_block);
  }

  HmacSha512(const HmacSha512&) = delete;
  HmacSha512& operator=(const HmacSha512&) = delete;

  ~HmacSha512() {
    SecureWipe(inner_pad_);
    SecureWipe(outer_pad_);
    SecureWipe(scratch_);
  }

  // `message` may alias `out`.
  void Compute(std::span<const std::uint8_t> message, std::span<std::uint8_t, kDigestSize> out) {
    // inner = SHA512(ipad || message)
    SecureWipe(scratch_.data(), scratch_.size());
    scratch_.clear();
    scratch_.reserve(kBlockSize + message.size());
    scratch_.insert(scratch_.end(), inner_pad_.begin(), inner_pad_.end());
    scratch_.insert(scratch_.end(), message.begin(), message.end());
    std::array<std::uint8_t, kBlockSize + kDigestSize> outer_input{};
    OQS_SHA2_sha512(outer_input.data() + kBlockSize, scratch_.data(), scratch_.size());

    // outer = SHA512(opad || inner)
    std::copy(outer_pad_.begin(), outer_pad_.end(), outer_input.begin());
    OQS_SHA2_sha512(out.data(), outer_input.data(), outer_input.size());
    SecureWipe(outer_input);
  }

 private:
  std::array<std::uint8_t, kBlockSize> inner_pad_{};
  std::array<std::uint8_t, kBlockSize> outer_pad_{};
  std::vector<std::uint8_t> scratch_;
};

}  // namespace

SecureBytes Pbkdf2HmacSha512(std::string_view password,
                             std::span<const std::uint8_t> salt,
                             std::uint32_t iterations,
                             std::size_t dk_len) {
  if (iterations == 0) {
    throw std::invalid_argument("PBKDF2 iteration count must be at least 1");
  }
  if (dk_len == 0) {
    throw std::invalid_argument("PBKDF2 output length must be at least 1");
  }

  HmacSha512 prf(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(password.data()), password.size()));
  SecureBytes dk(dk_len);

  const std::uint32_t block_count =
      static_cast<std::uint32_t>((dk_len + kDigestSize - 1) / kDigestSize);

  // S || INT_32_BE(i); sized once so the salt is never left in a released
  // allocation.
  SecureBytes salt_block(salt.size() + 4);
  std::copy(salt.begin(), salt.end(), salt_block.data());

  std::array<std::uint8_t, kDigestSize> u{};
  std::array<std::uint8_t, kDigestSize> t{};
  std::size_t offset = 0;
  for (std::uint32_t block_index = 1; block_index <= block_count; ++block_index) {
    // U_1 = PRF(P, S || INT_32_BE(i))
    salt_block[salt.size() + 0] = static_cast<std::uint8_t>((block_index >> 24) & 0xFF);
    salt_block[salt.size() + 1] = static_cast<std::uint8_t>((block_index >> 16) & 0xFF);
    salt_block[salt.size() + 2] = static_cast<std::uint8_t>((block_index >> 8) & 0xFF);
    salt_block[salt.size() + 3] = static_cast<std::uint8_t>(block_index & 0xFF);
    prf.Compute(salt_block.span(), u);
    t = u;

    for (std::uint32_t i = 1; i < iterations; ++i) {
      prf.Compute(u, u);
      for (std::size_t j = 0; j < t.size(); ++j) {
        t[j] ^= u[j];
      }
    }

    const std::size_t to_copy = std::min(kDigestSize, dk_len - offset);
    std::copy_n(t.begin(), to_copy, dk.data() + offset);
    offset += to_copy;
  }
  SecureWipe(u);
  SecureWipe(t);
  return dk;
}

}  // namespace s33d::util
