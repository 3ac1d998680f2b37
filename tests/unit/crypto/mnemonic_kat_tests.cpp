#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/entropy.hpp"
#include "crypto/hash.hpp"
#include "crypto/mnemonic.hpp"
#include "crypto/mnemonic_error.hpp"
#include "crypto/wordlist.hpp"
#include "tests/unit/util/test_entropy.hpp"
#include "util/hex.hpp"

namespace {

using namespace s33d;

struct PhraseVector {
  const char* entropy_hex;
  const char* phrase;
};

bool RequirePhrase(std::span<const std::uint8_t> entropy, std::string_view expected) {
  const auto phrase = crypto::EncodeMnemonic(entropy, crypto::EnglishWordlist());
  if (phrase.Sentence() != expected) {
    std::cerr << "entropy " << test::BytesToHex(entropy) << " encoded to '" << phrase.Sentence()
              << "', expected '" << expected << "'\n";
    return false;
  }
  return true;
}

bool TestAllZeroEntropyForEveryStrength() {
  struct Case {
    std::size_t bytes;
    std::size_t words;
    const char* last;
  };
  const Case cases[] = {
      {16, 12, "about"}, {20, 15, "address"}, {24, 18, "agent"},
      {28, 21, "admit"}, {32, 24, "art"},
  };
  for (const auto& c : cases) {
    const auto entropy = test::Bytes(c.bytes, 0x00);
    if (!RequirePhrase(entropy, test::Repeat("abandon", c.words, c.last))) {
      return false;
    }
  }
  return true;
}

bool TestReferenceVectors() {
  const PhraseVector vectors[] = {
      {"7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f",
       "legal winner thank year wave sausage worth useful legal winner thank yellow"},
      {"9e885d952ad362caeb4efe34a8e91bd2",
       "ozone drill grab fiber curtain grace pudding thank cruise elder eight picnic"},
  };
  for (const auto& v : vectors) {
    std::vector<std::uint8_t> entropy;
    if (!util::HexDecode(v.entropy_hex, &entropy)) {
      std::cerr << "bad test vector hex\n";
      return false;
    }
    if (!RequirePhrase(entropy, v.phrase)) {
      return false;
    }
  }
  const auto all_ones = test::Bytes(32, 0xFF);
  return RequirePhrase(all_ones, test::Repeat("zoo", 24, "vote"));
}

bool TestWordCountFormula() {
  const std::size_t expected[] = {12, 15, 18, 21, 24};
  for (std::size_t i = 0; i < crypto::kAllStrengths.size(); ++i) {
    const auto strength = crypto::kAllStrengths[i];
    if (crypto::WordCount(strength) != expected[i]) {
      std::cerr << "word count mismatch for " << crypto::StrengthBits(strength) << " bits\n";
      return false;
    }
    const auto entropy = test::Bytes(crypto::EntropyBytes(strength), 0x5A);
    const auto phrase = crypto::EncodeMnemonic(entropy, crypto::EnglishWordlist());
    if (phrase.word_count() != expected[i] || phrase.Words().size() != expected[i]) {
      std::cerr << "phrase for " << crypto::StrengthBits(strength) << " bits has "
                << phrase.Words().size() << " words\n";
      return false;
    }
    if (crypto::StrengthFromWordCount(expected[i]) != strength ||
        crypto::StrengthFromBits(crypto::StrengthBits(strength)) != strength) {
      std::cerr << "strength lookups disagree for " << expected[i] << " words\n";
      return false;
    }
  }
  return true;
}

bool TestEncodingIsDeterministic() {
  std::vector<std::uint8_t> entropy(24);
  for (std::size_t i = 0; i < entropy.size(); ++i) {
    entropy[i] = static_cast<std::uint8_t>(i * 29 + 7);
  }
  const auto a = crypto::EncodeMnemonic(entropy, crypto::EnglishWordlist());
  const auto b = crypto::EncodeMnemonic(entropy, crypto::EnglishWordlist());
  if (a.Sentence() != b.Sentence()) {
    std::cerr << "same entropy produced different phrases\n";
    return false;
  }
  return true;
}

// Rebuilds ENT || CS from the word indices and checks both halves.
bool TestChecksumRecoverableFromWords() {
  const auto& wordlist = crypto::EnglishWordlist();
  for (const auto strength : crypto::kAllStrengths) {
    for (std::uint8_t seed = 1; seed < 9; ++seed) {
      std::vector<std::uint8_t> entropy(crypto::EntropyBytes(strength));
      for (std::size_t i = 0; i < entropy.size(); ++i) {
        entropy[i] = static_cast<std::uint8_t>(seed * 37 + i * 101);
      }
      const auto phrase = crypto::EncodeMnemonic(entropy, wordlist);

      std::vector<bool> bits;
      for (const auto word : phrase.Words()) {
        const auto index = wordlist.IndexOf(word);
        if (!index) {
          std::cerr << "encoded word missing from wordlist\n";
          return false;
        }
        for (int b = 10; b >= 0; --b) {
          bits.push_back(((*index >> b) & 1) != 0);
        }
      }
      const std::size_t ent_bits = crypto::StrengthBits(strength);
      std::vector<std::uint8_t> recovered(entropy.size(), 0);
      for (std::size_t i = 0; i < ent_bits; ++i) {
        if (bits[i]) {
          recovered[i / 8] = static_cast<std::uint8_t>(recovered[i / 8] | (0x80 >> (i % 8)));
        }
      }
      if (recovered != entropy) {
        std::cerr << "leading bits do not reproduce the entropy\n";
        return false;
      }
      const std::size_t cs_bits = crypto::ChecksumBits(strength);
      unsigned checksum = 0;
      for (std::size_t i = 0; i < cs_bits; ++i) {
        checksum = (checksum << 1) | (bits[ent_bits + i] ? 1u : 0u);
      }
      const auto digest = crypto::Sha256(recovered);
      const unsigned expected = digest[0] >> (8 - cs_bits);
      if (checksum != expected || checksum != crypto::MnemonicChecksum(entropy)) {
        std::cerr << "checksum bits in last word do not match SHA-256 prefix\n";
        return false;
      }
    }
  }
  return true;
}

bool TestRejectsIllegalEntropyLength() {
  for (const std::size_t bytes : {0u, 1u, 15u, 17u, 31u, 33u, 64u}) {
    const auto entropy = test::Bytes(bytes, 0x11);
    try {
      (void)crypto::EncodeMnemonic(entropy, crypto::EnglishWordlist());
      std::cerr << bytes << "-byte entropy was accepted\n";
      return false;
    } catch (const crypto::MnemonicError& ex) {
      if (ex.kind != crypto::ErrorKind::kInvalidEntropyLength) {
        std::cerr << "unexpected error kind for " << bytes << " bytes: " << ex.what() << "\n";
        return false;
      }
    }
  }
  return true;
}

bool TestStrengthValidation() {
  for (const std::size_t bits : {0u, 64u, 127u, 129u, 512u}) {
    try {
      (void)crypto::StrengthFromBits(bits);
      std::cerr << bits << " bits accepted\n";
      return false;
    } catch (const crypto::MnemonicError& ex) {
      if (ex.kind != crypto::ErrorKind::kInvalidStrength) {
        return false;
      }
    }
  }
  for (const std::size_t words : {0u, 11u, 13u, 25u}) {
    try {
      (void)crypto::StrengthFromWordCount(words);
      std::cerr << words << " words accepted\n";
      return false;
    } catch (const crypto::MnemonicError& ex) {
      if (ex.kind != crypto::ErrorKind::kInvalidWordCount) {
        return false;
      }
    }
  }
  return true;
}

bool TestPhraseWipe() {
  const auto entropy = test::Bytes(16, 0x00);
  auto phrase = crypto::EncodeMnemonic(entropy, crypto::EnglishWordlist());
  phrase.Wipe();
  if (!phrase.Sentence().empty() || phrase.word_count() != 0 || !phrase.Words().empty()) {
    std::cerr << "wiped phrase still exposes words\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!TestAllZeroEntropyForEveryStrength()) {
    return EXIT_FAILURE;
  }
  if (!TestReferenceVectors()) {
    return EXIT_FAILURE;
  }
  if (!TestWordCountFormula()) {
    return EXIT_FAILURE;
  }
  if (!TestEncodingIsDeterministic()) {
    return EXIT_FAILURE;
  }
  if (!TestChecksumRecoverableFromWords()) {
    return EXIT_FAILURE;
  }
  if (!TestRejectsIllegalEntropyLength()) {
    return EXIT_FAILURE;
  }
  if (!TestStrengthValidation()) {
    return EXIT_FAILURE;
  }
  if (!TestPhraseWipe()) {
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
