#include "wallet/seed_generator.hpp"

#include <utility>

#include "crypto/mnemonic_error.hpp"
#include "util/logging.hpp"

namespace s33d::wallet {

crypto::EntropyStrength ResolveStrength(const GenerationParams& params) {
  if (params.word_count && params.strength_bits) {
    crypto::ThrowMnemonicError(crypto::ErrorKind::kInvalidArgument,
                               "--words and --bits cannot be used together");
  }
  if (params.word_count) {
    return crypto::StrengthFromWordCount(*params.word_count);
  }
  if (params.strength_bits) {
    return crypto::StrengthFromBits(*params.strength_bits);
  }
  return crypto::kDefaultStrength;
}

GeneratedMnemonic GenerateMnemonic(const GenerationParams& params,
                                   crypto::EntropySource& source,
                                   crypto::WordlistRegistry& registry) {
  const auto strength = ResolveStrength(params);
  const auto language = config::LanguageFromString(params.language);
  const auto& wordlist = registry.Get(language);

  util::LogInfo("generating " + std::to_string(crypto::WordCount(strength)) + "-word " +
                std::string(config::LanguageName(language)) + " phrase (" +
                std::to_string(crypto::StrengthBits(strength)) + " bits)");

  auto entropy = crypto::GenerateEntropy(strength, source);
  auto phrase = crypto::EncodeMnemonic(entropy.span(), wordlist);
  return GeneratedMnemonic{strength, std::move(entropy), std::move(phrase)};
}

void ConfirmPassphrase(const util::SecureString& passphrase,
                       const util::SecureString* confirmation) {
  if (passphrase.empty()) {
    return;
  }
  if (confirmation == nullptr ||
      !util::ConstantTimeEqual(passphrase.view(), confirmation->view())) {
    util::LogWarn("passphrase confirmation failed");
    crypto::ThrowMnemonicError(crypto::ErrorKind::kPassphraseMismatch,
                               "passphrases do not match");
  }
}

crypto::Seed DeriveConfirmedSeed(const crypto::MnemonicPhrase& phrase,
                                 const util::SecureString& passphrase,
                                 const util::SecureString* confirmation) {
  ConfirmPassphrase(passphrase, confirmation);
  return crypto::DeriveSeed(phrase, passphrase.view());
}

}  // namespace s33d::wallet
