#pragma once

#include <string_view>

#include "util/secure_buffer.hpp"

namespace s33d::cli {

// Reads one secret line. Implementations return false when no line can be
// read (closed stream, no terminal); `out` is then left empty.
class SecretPrompt {
 public:
  virtual ~SecretPrompt() = default;
  virtual bool ReadSecret(std::string_view prompt, util::SecureString* out) = 0;
};

// Prompts on stderr and reads stdin with terminal echo disabled. Refuses to
// read from a non-interactive stdin.
class TerminalSecretPrompt final : public SecretPrompt {
 public:
  bool ReadSecret(std::string_view prompt, util::SecureString* out) override;
};

// Asks for a passphrase and, when it is non-empty, for a confirmation.
// Throws crypto::MnemonicError: kPassphrasePromptFailure when a read fails,
// kPassphraseMismatch when the entries differ.
util::SecureString ReadConfirmedPassphrase(SecretPrompt& prompt);

}  // namespace s33d::cli
