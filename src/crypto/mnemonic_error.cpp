#include "crypto/mnemonic_error.hpp"

namespace s33d::crypto {

std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kUnsupportedLanguage:
      return "UnsupportedLanguage";
    case ErrorKind::kInvalidStrength:
      return "InvalidStrength";
    case ErrorKind::kInvalidWordCount:
      return "InvalidWordCount";
    case ErrorKind::kInvalidEntropyLength:
      return "InvalidEntropyLength";
    case ErrorKind::kEntropySourceUnavailable:
      return "EntropySourceUnavailable";
    case ErrorKind::kMnemonicEncodingFailure:
      return "MnemonicEncodingFailure";
    case ErrorKind::kWordlistUnavailable:
      return "WordlistUnavailable";
    case ErrorKind::kMalformedUtf8:
      return "MalformedUtf8";
    case ErrorKind::kPassphraseMismatch:
      return "PassphraseMismatch";
    case ErrorKind::kPassphrasePromptFailure:
      return "PassphrasePromptFailure";
    case ErrorKind::kInvalidArgument:
      return "InvalidArgument";
    case ErrorKind::kQrUnavailable:
      return "QrUnavailable";
  }
  return "Unknown";
}

int ExitCodeFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kPassphraseMismatch:
      return 2;
    case ErrorKind::kPassphrasePromptFailure:
      return 3;
    default:
      return 1;
  }
}

[[noreturn]] void ThrowMnemonicError(ErrorKind kind, const std::string& msg) {
  throw MnemonicError(kind, msg);
}

}  // namespace s33d::crypto
