#include "cli/passphrase_prompt.hpp"

#include <cerrno>
#include <cstdio>
#include <iostream>
#include <utility>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>
#include <io.h>
#else
#include <termios.h>
#include <unistd.h>
#endif

#include "crypto/mnemonic_error.hpp"
#include "util/logging.hpp"
#include "wallet/seed_generator.hpp"

namespace s33d::cli {

namespace {

bool IsStdinInteractive() {
#ifdef _WIN32
  return _isatty(_fileno(stdin)) != 0;
#else
  return isatty(fileno(stdin)) != 0;
#endif
}

// One byte straight from the descriptor. stdio and iostream buffers are
// bypassed so no copy of the secret outlives the read.
bool ReadStdinByte(char* ch) {
#ifdef _WIN32
  return _read(_fileno(stdin), ch, 1) == 1;
#else
  for (;;) {
    const ssize_t n = read(STDIN_FILENO, ch, 1);
    if (n == 1) {
      return true;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    return false;
  }
#endif
}

// Disables terminal echo for its lifetime.
class EchoGuard {
 public:
  EchoGuard() {
#ifdef _WIN32
    handle_ = GetStdHandle(STD_INPUT_HANDLE);
    if (handle_ != INVALID_HANDLE_VALUE && GetConsoleMode(handle_, &original_mode_)) {
      active_ = true;
      const DWORD new_mode = original_mode_ & ~static_cast<DWORD>(ENABLE_ECHO_INPUT);
      (void)SetConsoleMode(handle_, new_mode);
    }
#else
    if (tcgetattr(STDIN_FILENO, &original_) == 0) {
      active_ = true;
      termios updated = original_;
      updated.c_lflag &= static_cast<tcflag_t>(~ECHO);
      (void)tcsetattr(STDIN_FILENO, TCSAFLUSH, &updated);
    }
#endif
  }

  EchoGuard(const EchoGuard&) = delete;
  EchoGuard& operator=(const EchoGuard&) = delete;

  ~EchoGuard() {
    if (!active_) {
      return;
    }
#ifdef _WIN32
    (void)SetConsoleMode(handle_, original_mode_);
#else
    (void)tcsetattr(STDIN_FILENO, TCSAFLUSH, &original_);
#endif
  }

 private:
  bool active_{false};
#ifdef _WIN32
  HANDLE handle_{INVALID_HANDLE_VALUE};
  DWORD original_mode_{0};
#else
  termios original_{};
#endif
};

}  // namespace

bool TerminalSecretPrompt::ReadSecret(std::string_view prompt, util::SecureString* out) {
  out->Clear();
  if (!IsStdinInteractive()) {
    util::LogWarn("passphrase prompt refused: stdin is not interactive");
    return false;
  }
  std::cerr << prompt << std::flush;
  bool terminated = false;
  {
    EchoGuard guard;
    char ch = 0;
    while (ReadStdinByte(&ch)) {
      if (ch == '\n') {
        terminated = true;
        break;
      }
      out->PushBack(ch);
    }
  }
  std::cerr << "\n";
  if (!terminated && out->empty()) {
    return false;
  }
  if (!out->empty() && out->view().back() == '\r') {
    util::SecureString trimmed(out->view().substr(0, out->size() - 1));
    *out = std::move(trimmed);
  }
  return true;
}

util::SecureString ReadConfirmedPassphrase(SecretPrompt& prompt) {
  util::SecureString passphrase;
  if (!prompt.ReadSecret("enter passphrase (leave blank for none): ", &passphrase)) {
    crypto::ThrowMnemonicError(crypto::ErrorKind::kPassphrasePromptFailure,
                               "failed to read passphrase");
  }
  if (passphrase.empty()) {
    util::LogInfo("empty passphrase entered; confirmation skipped");
    return passphrase;
  }
  util::SecureString confirmation;
  if (!prompt.ReadSecret("confirm passphrase: ", &confirmation)) {
    crypto::ThrowMnemonicError(crypto::ErrorKind::kPassphrasePromptFailure,
                               "failed to read passphrase");
  }
  wallet::ConfirmPassphrase(passphrase, &confirmation);
  return passphrase;
}

}  // namespace s33d::cli
