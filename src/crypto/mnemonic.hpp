#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "config/language.hpp"
#include "crypto/entropy.hpp"
#include "crypto/wordlist.hpp"
#include "util/secure_buffer.hpp"

namespace s33d::crypto {

inline constexpr std::size_t kSeedBytes = 64;
inline constexpr std::uint32_t kSeedIterations = 2048;
inline constexpr std::string_view kSeedSaltPrefix = "mnemonic";

using Seed = util::SecureArray<kSeedBytes>;

// An encoded BIP39 phrase. Words are kept in one wiped-on-drop buffer,
// separated by single ASCII spaces; Words() returns views into it.
class MnemonicPhrase {
 public:
  MnemonicPhrase(config::Language language, util::SecureString sentence, std::size_t word_count)
      : language_(language), sentence_(std::move(sentence)), word_count_(word_count) {}

  MnemonicPhrase(MnemonicPhrase&&) noexcept = default;
  MnemonicPhrase& operator=(MnemonicPhrase&&) noexcept = default;

  config::Language language() const { return language_; }
  std::size_t word_count() const { return word_count_; }
  std::string_view Sentence() const { return sentence_.view(); }
  std::vector<std::string_view> Words() const;

  void Wipe() noexcept {
    sentence_.Clear();
    word_count_ = 0;
  }

 private:
  config::Language language_;
  util::SecureString sentence_;
  std::size_t word_count_{0};
};

// First ChecksumBits(strength) bits of SHA-256(entropy), right-aligned.
// Throws MnemonicError(kInvalidEntropyLength) for a bad buffer length.
std::uint8_t MnemonicChecksum(std::span<const std::uint8_t> entropy);

// BIP39 entropy to phrase. The entropy length must be 16, 20, 24, 28 or 32
// bytes (kInvalidEntropyLength otherwise). A wordlist that cannot address
// every 11-bit index raises kMnemonicEncodingFailure.
MnemonicPhrase EncodeMnemonic(std::span<const std::uint8_t> entropy, const Wordlist& wordlist);

// PBKDF2-HMAC-SHA512(NFKD(sentence), "mnemonic" || NFKD(passphrase), 2048, 64).
// Malformed UTF-8 in either input raises kMalformedUtf8.
Seed MnemonicSeedFromSentence(std::string_view sentence, std::string_view passphrase);
Seed DeriveSeed(const MnemonicPhrase& phrase, std::string_view passphrase);

}  // namespace s33d::crypto
