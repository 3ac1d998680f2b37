#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include "cli/options.hpp"
#include "cli/passphrase_prompt.hpp"
#include "cli/qr_render.hpp"
#include "cli/render.hpp"
#include "config/language.hpp"
#include "crypto/entropy.hpp"
#include "crypto/mnemonic.hpp"
#include "crypto/mnemonic_error.hpp"
#include "crypto/wordlist.hpp"
#include "util/csprng.hpp"
#include "util/logging.hpp"
#include "wallet/seed_generator.hpp"

namespace {

using s33d::cli::CliOptions;

std::optional<std::string> GetEnvValue(const char* name) {
  const char* value = std::getenv(name);
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

void ConfigureLogging(const CliOptions& opts) {
  auto& logger = s33d::util::GlobalLogger();
  if (opts.log_level) {
    logger.SetLevel(*opts.log_level);
  }
  std::string path = opts.debug_log;
  if (path.empty()) {
    path = GetEnvValue("S33D_DEBUG_LOG").value_or("");
  }
  if (!path.empty()) {
    logger.Enable(path);
  }
}

void LogRequest(const CliOptions& opts) {
  std::string summary = "options: language=" + opts.language;
  if (opts.words) {
    summary += " words=" + std::to_string(*opts.words);
  }
  if (opts.bits) {
    summary += " bits=" + std::to_string(*opts.bits);
  }
  summary += opts.clean ? " clean" : " decorated";
  if (opts.show_details) summary += " details";
  if (opts.show_hex) summary += " hex";
  if (opts.show_seed) summary += " seed";
  if (opts.passphrase) summary += " passphrase";
  if (opts.qr_code) summary += " qr";
  s33d::util::LogInfo(summary);
}

int Run(const CliOptions& opts) {
  if (opts.help) {
    s33d::cli::PrintUsage(std::cout);
    return 0;
  }
  if (opts.version) {
    std::cout << "s33d " << s33d::cli::kVersion << "\n";
    return 0;
  }
  if (opts.list_languages) {
    s33d::cli::PrintLanguageList(std::cout);
    return 0;
  }

  ConfigureLogging(opts);
  LogRequest(opts);

  if (opts.qr_code && !s33d::cli::QrSupported()) {
    s33d::crypto::ThrowMnemonicError(s33d::crypto::ErrorKind::kQrUnavailable,
                                     "QR output requires libqrencode, which this build lacks");
  }

  if (!opts.clean) {
    for (const auto& warning : s33d::util::EntropySourceWarnings()) {
      s33d::util::LogWarn(warning);
      s33d::cli::PrintWarningBox(std::cout, warning);
    }
  }

  s33d::wallet::GenerationParams params;
  params.word_count = opts.words;
  params.strength_bits = opts.bits;
  params.language = opts.language;

  const std::string wordlist_dir =
      opts.wordlist_dir.empty() ? s33d::config::DefaultWordlistDir() : opts.wordlist_dir;
  s33d::crypto::WordlistRegistry registry(wordlist_dir);
  s33d::crypto::SystemEntropySource entropy_source;
  auto generated = s33d::wallet::GenerateMnemonic(params, entropy_source, registry);

  s33d::util::SecureString passphrase;
  if (opts.passphrase) {
    s33d::cli::TerminalSecretPrompt prompt;
    passphrase = s33d::cli::ReadConfirmedPassphrase(prompt);
  }

  std::optional<s33d::crypto::Seed> seed;
  if (opts.show_seed) {
    seed.emplace(s33d::crypto::DeriveSeed(generated.phrase, passphrase.view()));
    s33d::util::LogInfo("seed derived");
  }
  passphrase.Clear();

  s33d::cli::DisplayOptions display;
  display.technical_details = opts.show_details;
  display.show_hex = opts.show_hex;
  display.show_seed = opts.show_seed;
  const s33d::crypto::Seed* seed_ptr = seed ? &*seed : nullptr;
  if (opts.clean) {
    s33d::cli::PrintClean(std::cout, generated, seed_ptr, display);
  } else {
    s33d::cli::PrintDecorated(std::cout, generated, seed_ptr, display);
  }
  if (opts.qr_code) {
    s33d::cli::PrintQrCode(std::cout, generated.phrase.Sentence());
  }
  std::cout.flush();
  generated.phrase.Wipe();
  s33d::util::LogInfo("phrase printed");
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  // Usage errors go to stderr; later failures follow the output mode.
  bool decorated = false;
  try {
    const auto opts = s33d::cli::ParseOptions(argc, argv);
    decorated = !opts.clean;
    return Run(opts);
  } catch (const s33d::crypto::MnemonicError& ex) {
    s33d::util::LogError(std::string(s33d::crypto::ErrorKindName(ex.kind)) + ": " + ex.what());
    if (decorated) {
      s33d::cli::PrintErrorBox(std::cout, ex.what());
    } else {
      std::cerr << "s33d: " << ex.what() << "\n";
    }
    return s33d::crypto::ExitCodeFor(ex.kind);
  } catch (const std::exception& ex) {
    s33d::util::LogError(ex.what());
    if (decorated) {
      s33d::cli::PrintErrorBox(std::cout, ex.what());
    } else {
      std::cerr << "s33d: " << ex.what() << "\n";
    }
    return 1;
  }
}
