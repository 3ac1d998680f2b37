#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

#include "crypto/mnemonic.hpp"
#include "crypto/mnemonic_error.hpp"
#include "crypto/wordlist.hpp"
#include "tests/unit/util/test_entropy.hpp"

namespace {

using namespace s33d;

bool RequireSeed(std::string_view sentence, std::string_view passphrase,
                 std::string_view expected_hex, std::string_view label) {
  const auto seed = crypto::MnemonicSeedFromSentence(sentence, passphrase);
  const auto hex = test::BytesToHex(seed.span());
  if (hex != expected_hex) {
    std::cerr << label << ": seed mismatch\n  got      " << hex << "\n  expected "
              << expected_hex << "\n";
    return false;
  }
  return true;
}

bool TestReferenceSeeds() {
  const auto twelve = test::Repeat("abandon", 12, "about");
  const auto twenty_four = test::Repeat("abandon", 24, "art");
  return RequireSeed(twelve, "",
                     "5eb00bbddcf069084889a8ab9155568165f5c453ccb85e70811aaed6f6da5fc1"
                     "9a5ac40b389cd370d086206dec8aa6c43daea6690f20ad3d8d48b2d2ce9e38e4",
                     "12 words, empty passphrase") &&
         RequireSeed(twelve, "TREZOR",
                     "c55257c360c07c72029aebc1b53c05ed0362ada38ead3e3e9efa3708e5349553"
                     "1f09a6987599d18264c1e1c92f2cf141630c7a3c4ab7c81b2f001698e7463b04",
                     "12 words, TREZOR") &&
         RequireSeed(twenty_four, "TREZOR",
                     "bda85446c68413707090a52022edd26a1c9462295029f2e60cd7c4f2bbd30971"
                     "70af7a4d73245cafa9c3cca8d561a7c3de6f5d4a10be8ed2a5e608d68f92fcc8",
                     "24 words, TREZOR") &&
         RequireSeed(twenty_four, "",
                     "408b285c123836004f4b8842c89324c1f01382450c0d439af345ba7fc49acf70"
                     "5489c6fc77dbd4e3dc1dd8cc6bc9f043db8ada1e243c4a0eafb290d399480840",
                     "24 words, empty passphrase");
}

bool TestPhraseAndSentenceAgree() {
  const auto entropy = test::Bytes(16, 0x00);
  const auto phrase = crypto::EncodeMnemonic(entropy, crypto::EnglishWordlist());
  const auto from_phrase = crypto::DeriveSeed(phrase, "nonempty");
  const auto hex = test::BytesToHex(from_phrase.span());
  if (hex != "efdf395070f7948fdc553bb55bdc5208483e7bd06262dfd6f4dfa220753c5882"
             "9280c517fa390ce0d2e01a826d6c5a5441ab87142fbc62b5d8036b2193621e6b") {
    std::cerr << "DeriveSeed disagrees with reference seed: " << hex << "\n";
    return false;
  }
  return true;
}

bool TestPassphraseChangesSeed() {
  const auto sentence = test::Repeat("abandon", 12, "about");
  const auto a = crypto::MnemonicSeedFromSentence(sentence, "");
  const auto b = crypto::MnemonicSeedFromSentence(sentence, "nonempty");
  const auto c = crypto::MnemonicSeedFromSentence(sentence, "nonempty ");
  const auto ha = test::BytesToHex(a.span());
  const auto hb = test::BytesToHex(b.span());
  const auto hc = test::BytesToHex(c.span());
  if (ha == hb || hb == hc) {
    std::cerr << "different passphrases produced the same seed\n";
    return false;
  }
  return true;
}

bool TestPassphraseIsNfkdNormalized() {
  const auto sentence = test::Repeat("abandon", 12, "about");
  const std::string composed = "caf\xC3\xA9";     // U+00E9
  const std::string decomposed = "cafe\xCC\x81";  // e + U+0301
  const auto a = crypto::MnemonicSeedFromSentence(sentence, composed);
  const auto b = crypto::MnemonicSeedFromSentence(sentence, decomposed);
  const auto ha = test::BytesToHex(a.span());
  if (ha != test::BytesToHex(b.span())) {
    std::cerr << "canonically equivalent passphrases produced different seeds\n";
    return false;
  }
  if (ha != "af8bbd2566df7b69d926f2b09dfdbd75db6c994a3399b2cc65f928d63e3fd4e6"
            "1218ee0d15f8c810be4d45e66d47b43c15a5cc753976b1666912377ff7ae9818") {
    std::cerr << "normalized passphrase seed mismatch: " << ha << "\n";
    return false;
  }
  return true;
}

bool TestMalformedUtf8Rejected() {
  const auto sentence = test::Repeat("abandon", 12, "about");
  const std::string bad_inputs[] = {
      std::string("\xC3", 1),          // truncated sequence
      std::string("\xC0\xAF"),          // overlong '/'
      std::string("\xED\xA0\x80"),      // encoded surrogate
      std::string("pass\xFFword"),
  };
  for (const auto& bad : bad_inputs) {
    try {
      (void)crypto::MnemonicSeedFromSentence(sentence, bad);
      std::cerr << "malformed passphrase accepted\n";
      return false;
    } catch (const crypto::MnemonicError& ex) {
      if (ex.kind != crypto::ErrorKind::kMalformedUtf8) {
        std::cerr << "unexpected error kind: " << ex.what() << "\n";
        return false;
      }
      const std::string message = ex.what();
      if (message.find(bad) != std::string::npos) {
        std::cerr << "error message echoes the passphrase\n";
        return false;
      }
    }
  }
  return true;
}

}  // namespace

int main() {
  if (!TestReferenceSeeds()) {
    return EXIT_FAILURE;
  }
  if (!TestPhraseAndSentenceAgree()) {
    return EXIT_FAILURE;
  }
  if (!TestPassphraseChangesSeed()) {
    return EXIT_FAILURE;
  }
  if (!TestPassphraseIsNfkdNormalized()) {
    return EXIT_FAILURE;
  }
  if (!TestMalformedUtf8Rejected()) {
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
