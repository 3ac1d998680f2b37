#include "crypto/mnemonic.hpp"

#include <algorithm>
#include <string>

#include "crypto/hash.hpp"
#include "crypto/mnemonic_error.hpp"
#include "util/pbkdf2.hpp"
#include "util/secure_wipe.hpp"
#include "util/unicode.hpp"

namespace s33d::crypto {

namespace {

constexpr std::size_t kBitsPerWord = 11;

EntropyStrength RequireEntropyLength(std::size_t bytes) {
  const auto strength = StrengthFromEntropyLength(bytes);
  if (!strength) {
    ThrowMnemonicError(ErrorKind::kInvalidEntropyLength,
                       "invalid entropy length " + std::to_string(bytes) +
                           " bytes (expected 16, 20, 24, 28 or 32)");
  }
  return *strength;
}

// Reads 11 bits big-endian starting at `bit_offset`.
std::uint16_t ReadWordIndex(std::span<const std::uint8_t> bytes, std::size_t bit_offset) {
  std::uint16_t value = 0;
  for (std::size_t i = 0; i < kBitsPerWord; ++i) {
    const std::size_t pos = bit_offset + i;
    const unsigned bit = (bytes[pos / 8] >> (7 - (pos % 8))) & 1u;
    value = static_cast<std::uint16_t>((value << 1) | bit);
  }
  return value;
}

util::SecureString NormalizeOrThrow(std::string_view text, const char* what) {
  util::SecureString normalized;
  std::string error;
  if (!util::NormalizeNfkd(text, &normalized, &error)) {
    ThrowMnemonicError(ErrorKind::kMalformedUtf8, std::string(what) + ": " + error);
  }
  return normalized;
}

}  // namespace

std::vector<std::string_view> MnemonicPhrase::Words() const {
  std::vector<std::string_view> words;
  words.reserve(word_count_);
  const std::string_view sentence = sentence_.view();
  std::size_t start = 0;
  while (start < sentence.size()) {
    std::size_t end = sentence.find(' ', start);
    if (end == std::string_view::npos) {
      end = sentence.size();
    }
    words.push_back(sentence.substr(start, end - start));
    start = end + 1;
  }
  return words;
}

std::uint8_t MnemonicChecksum(std::span<const std::uint8_t> entropy) {
  const auto strength = RequireEntropyLength(entropy.size());
  auto digest = Sha256(entropy);
  const std::size_t cs_bits = ChecksumBits(strength);
  const auto checksum = static_cast<std::uint8_t>(digest[0] >> (8 - cs_bits));
  util::SecureWipe(digest);
  return checksum;
}

MnemonicPhrase EncodeMnemonic(std::span<const std::uint8_t> entropy, const Wordlist& wordlist) {
  const auto strength = RequireEntropyLength(entropy.size());
  if (wordlist.size() != Wordlist::kSize) {
    ThrowMnemonicError(ErrorKind::kMnemonicEncodingFailure,
                       "wordlist does not hold 2048 entries");
  }

  // entropy || SHA-256(entropy)[0]. The checksum is at most 8 bits, so the
  // first digest byte always covers it.
  util::SecureBytes packed(entropy.size() + 1);
  std::copy(entropy.begin(), entropy.end(), packed.data());
  auto digest = Sha256(entropy);
  packed[entropy.size()] = digest[0];
  util::SecureWipe(digest);

  const std::size_t word_count = WordCount(strength);
  util::SecureString sentence;
  sentence.Reserve(word_count * 9);
  for (std::size_t i = 0; i < word_count; ++i) {
    const std::uint16_t index = ReadWordIndex(packed.span(), i * kBitsPerWord);
    if (i != 0) {
      sentence.PushBack(' ');
    }
    sentence.Append(wordlist.Word(index));
  }
  return MnemonicPhrase(wordlist.language(), std::move(sentence), word_count);
}

Seed MnemonicSeedFromSentence(std::string_view sentence, std::string_view passphrase) {
  const auto normalized_sentence = NormalizeOrThrow(sentence, "mnemonic");
  const auto normalized_passphrase = NormalizeOrThrow(passphrase, "passphrase");

  // salt = "mnemonic" + passphrase (UTF-8, no NUL terminator).
  util::SecureString salt;
  salt.Reserve(kSeedSaltPrefix.size() + normalized_passphrase.size());
  salt.Append(kSeedSaltPrefix);
  salt.Append(normalized_passphrase.view());
  const auto salt_bytes = std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(salt.view().data()), salt.size());

  const auto derived = util::Pbkdf2HmacSha512(normalized_sentence.view(), salt_bytes,
                                              kSeedIterations, kSeedBytes);
  Seed seed;
  std::copy_n(derived.data(), kSeedBytes, seed.data());
  return seed;
}

Seed DeriveSeed(const MnemonicPhrase& phrase, std::string_view passphrase) {
  return MnemonicSeedFromSentence(phrase.Sentence(), passphrase);
}

}  // namespace s33d::crypto
