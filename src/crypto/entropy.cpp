#include "crypto/entropy.hpp"

#include <string>

#include "crypto/mnemonic_error.hpp"
#include "util/logging.hpp"

namespace s33d::crypto {

EntropyStrength StrengthFromBits(std::size_t bits) {
  for (const auto strength : kAllStrengths) {
    if (StrengthBits(strength) == bits) {
      return strength;
    }
  }
  ThrowMnemonicError(ErrorKind::kInvalidStrength,
                     "invalid entropy strength " + std::to_string(bits) +
                         " bits (expected 128, 160, 192, 224 or 256)");
}

EntropyStrength StrengthFromWordCount(std::size_t words) {
  for (const auto strength : kAllStrengths) {
    if (WordCount(strength) == words) {
      return strength;
    }
  }
  ThrowMnemonicError(ErrorKind::kInvalidWordCount,
                     "invalid word count " + std::to_string(words) +
                         " (expected 12, 15, 18, 21 or 24)");
}

std::optional<EntropyStrength> StrengthFromEntropyLength(std::size_t bytes) {
  for (const auto strength : kAllStrengths) {
    if (EntropyBytes(strength) == bytes) {
      return strength;
    }
  }
  return std::nullopt;
}

void SystemEntropySource::Fill(std::span<std::uint8_t> out) {
  util::RandomSource used{};
  std::string error;
  if (!util::FillSecureRandomBytes(out, &used, &error)) {
    // FillSecureRandomBytes may have written a prefix before failing.
    util::SecureWipe(out.data(), out.size());
    util::LogError("entropy source unavailable: " + error);
    ThrowMnemonicError(ErrorKind::kEntropySourceUnavailable,
                       "system entropy source unavailable: " + error);
  }
  if (!last_source_ || *last_source_ != used) {
    util::LogDebug("entropy drawn from " + std::string(util::RandomSourceName(used)));
  }
  last_source_ = used;
}

util::SecureBytes GenerateEntropy(EntropyStrength strength, EntropySource& source) {
  util::SecureBytes entropy(EntropyBytes(strength));
  source.Fill(entropy.span());
  return entropy;
}

}  // namespace s33d::crypto
