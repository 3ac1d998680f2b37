#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "config/language.hpp"
#include "crypto/entropy.hpp"
#include "crypto/mnemonic.hpp"
#include "crypto/wordlist.hpp"
#include "util/secure_buffer.hpp"

namespace s33d::wallet {

// Caller-supplied generation request. At most one of word_count and
// strength_bits may be set; with neither, 128 bits are used.
struct GenerationParams {
  std::optional<std::size_t> word_count;
  std::optional<std::size_t> strength_bits;
  std::string language{"english"};
};

struct GeneratedMnemonic {
  crypto::EntropyStrength strength{crypto::kDefaultStrength};
  util::SecureBytes entropy;
  crypto::MnemonicPhrase phrase;
};

// Throws MnemonicError: kInvalidArgument when both sizes are given,
// kInvalidWordCount / kInvalidStrength for unsupported values.
crypto::EntropyStrength ResolveStrength(const GenerationParams& params);

// Validates the request, loads the wordlist, then draws entropy and encodes
// it. Every validation failure is raised before `source` is asked for any
// bytes.
GeneratedMnemonic GenerateMnemonic(const GenerationParams& params,
                                   crypto::EntropySource& source,
                                   crypto::WordlistRegistry& registry);

// Compares the two passphrase entries without an early exit. An empty first
// entry needs no confirmation (`confirmation` may be null). Throws
// MnemonicError(kPassphraseMismatch) when they differ.
void ConfirmPassphrase(const util::SecureString& passphrase,
                       const util::SecureString* confirmation);

// ConfirmPassphrase followed by seed derivation, so a mismatch never yields
// a seed.
crypto::Seed DeriveConfirmedSeed(const crypto::MnemonicPhrase& phrase,
                                 const util::SecureString& passphrase,
                                 const util::SecureString* confirmation);

}  // namespace s33d::wallet
