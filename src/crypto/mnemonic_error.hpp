#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace s33d::crypto {

enum class ErrorKind {
  kUnsupportedLanguage,
  kInvalidStrength,
  kInvalidWordCount,
  kInvalidEntropyLength,
  kEntropySourceUnavailable,
  kMnemonicEncodingFailure,
  kWordlistUnavailable,
  kMalformedUtf8,
  kPassphraseMismatch,
  kPassphrasePromptFailure,
  kInvalidArgument,
  kQrUnavailable,
};

std::string_view ErrorKindName(ErrorKind kind);

// Process exit status for a failure of the given kind: 2 for a passphrase
// mismatch, 3 for an unreadable prompt, 1 for everything else.
int ExitCodeFor(ErrorKind kind);

// Carries an ErrorKind tag in addition to the single-line message. Messages
// never include entropy, phrase, passphrase or seed bytes.
struct MnemonicError : public std::runtime_error {
  ErrorKind kind;
  MnemonicError(ErrorKind k, const std::string& msg) : std::runtime_error(msg), kind(k) {}
};

[[noreturn]] void ThrowMnemonicError(ErrorKind kind, const std::string& msg);

}  // namespace s33d::crypto
