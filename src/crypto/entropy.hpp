#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "util/csprng.hpp"
#include "util/secure_buffer.hpp"

namespace s33d::crypto {

// BIP39 entropy sizes. The enumerator value is the entropy length in bits.
enum class EntropyStrength : std::uint16_t {
  k128 = 128,
  k160 = 160,
  k192 = 192,
  k224 = 224,
  k256 = 256,
};

inline constexpr std::array<EntropyStrength, 5> kAllStrengths = {
    EntropyStrength::k128, EntropyStrength::k160, EntropyStrength::k192,
    EntropyStrength::k224, EntropyStrength::k256,
};

inline constexpr EntropyStrength kDefaultStrength = EntropyStrength::k128;

constexpr std::size_t StrengthBits(EntropyStrength strength) {
  return static_cast<std::size_t>(strength);
}
constexpr std::size_t EntropyBytes(EntropyStrength strength) { return StrengthBits(strength) / 8; }
constexpr std::size_t ChecksumBits(EntropyStrength strength) { return StrengthBits(strength) / 32; }
constexpr std::size_t WordCount(EntropyStrength strength) {
  return (StrengthBits(strength) + ChecksumBits(strength)) / 11;
}

// Throws MnemonicError(kInvalidStrength) unless bits is 128/160/192/224/256.
EntropyStrength StrengthFromBits(std::size_t bits);
// Throws MnemonicError(kInvalidWordCount) unless words is 12/15/18/21/24.
EntropyStrength StrengthFromWordCount(std::size_t words);
// Maps an entropy buffer length (16..32 bytes, step 4) to its strength.
std::optional<EntropyStrength> StrengthFromEntropyLength(std::size_t bytes);

// Source of entropy bytes for phrase generation. Production code uses the
// operating system CSPRNG; tests substitute deterministic sources.
class EntropySource {
 public:
  virtual ~EntropySource() = default;
  // Fills every byte of `out` or throws
  // MnemonicError(kEntropySourceUnavailable). Never returns partially
  // filled output.
  virtual void Fill(std::span<std::uint8_t> out) = 0;
};

class SystemEntropySource final : public EntropySource {
 public:
  void Fill(std::span<std::uint8_t> out) override;
  std::optional<util::RandomSource> last_source() const { return last_source_; }

 private:
  std::optional<util::RandomSource> last_source_;
};

// Draws exactly EntropyBytes(strength) bytes from `source`.
util::SecureBytes GenerateEntropy(EntropyStrength strength, EntropySource& source);

}  // namespace s33d::crypto
