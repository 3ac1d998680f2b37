#include <cstdlib>
#include <initializer_list>
#include <iostream>
#include <string>
#include <vector>

#include "cli/options.hpp"
#include "crypto/mnemonic_error.hpp"

namespace {

using namespace s33d;

cli::CliOptions Parse(std::initializer_list<const char*> args) {
  std::vector<std::string> storage{"s33d"};
  storage.insert(storage.end(), args.begin(), args.end());
  std::vector<char*> argv;
  for (auto& arg : storage) {
    argv.push_back(arg.data());
  }
  return cli::ParseOptions(static_cast<int>(argv.size()), argv.data());
}

bool ExpectParseError(std::initializer_list<const char*> args, crypto::ErrorKind kind,
                      const char* label) {
  try {
    (void)Parse(args);
    std::cerr << label << ": arguments accepted\n";
    return false;
  } catch (const crypto::MnemonicError& ex) {
    if (ex.kind != kind) {
      std::cerr << label << ": unexpected error '" << ex.what() << "'\n";
      return false;
    }
  }
  return true;
}

bool TestDefaults() {
  const auto opts = Parse({});
  if (opts.words || opts.bits || opts.language != "english" || opts.clean || opts.show_seed ||
      opts.passphrase || opts.qr_code || opts.list_languages || opts.log_level) {
    std::cerr << "unexpected defaults\n";
    return false;
  }
  return true;
}

bool TestShortAndLongForms() {
  const auto a = Parse({"-w", "24", "-l", "ja", "-e", "-x", "-s", "-p", "-c", "-q"});
  if (a.words != 24u || a.language != "ja" || !a.show_details || !a.show_hex || !a.show_seed ||
      !a.passphrase || !a.clean || !a.qr_code) {
    std::cerr << "short flags not parsed\n";
    return false;
  }
  const auto b = Parse({"--hex", "--seed", "--passphrase", "--list", "--bits=192",
                        "--wordlist-dir", "/tmp/lists", "--debug-log=/tmp/s33d.log",
                        "--log-level", "debug"});
  if (!b.show_hex || !b.show_seed || !b.passphrase || !b.list_languages || b.bits != 192u ||
      b.wordlist_dir != "/tmp/lists" || b.debug_log != "/tmp/s33d.log" ||
      b.log_level != util::LogLevel::kDebug) {
    std::cerr << "long flags not parsed\n";
    return false;
  }
  return true;
}

bool TestBundledFlags() {
  const auto opts = Parse({"-ecx", "-w12", "-lfr"});
  if (!opts.show_details || !opts.clean || !opts.show_hex || opts.words != 12u ||
      opts.language != "fr") {
    std::cerr << "bundled short flags not parsed\n";
    return false;
  }
  const auto help = Parse({"-h"});
  const auto version = Parse({"--version"});
  return help.help && version.version;
}

bool TestRejections() {
  return ExpectParseError({"-w", "12", "-b", "128"}, crypto::ErrorKind::kInvalidArgument,
                          "-w with -b") &&
         ExpectParseError({"-w", "15"}, crypto::ErrorKind::kInvalidWordCount, "-w 15") &&
         ExpectParseError({"-w", "twelve"}, crypto::ErrorKind::kInvalidArgument, "-w twelve") &&
         ExpectParseError({"-b", "100"}, crypto::ErrorKind::kInvalidStrength, "-b 100") &&
         ExpectParseError({"-b"}, crypto::ErrorKind::kInvalidArgument, "-b without value") &&
         ExpectParseError({"-l", "klingon"}, crypto::ErrorKind::kUnsupportedLanguage,
                          "-l klingon") &&
         ExpectParseError({"--log-level", "loud"}, crypto::ErrorKind::kInvalidArgument,
                          "bad log level") &&
         ExpectParseError({"--frobnicate"}, crypto::ErrorKind::kInvalidArgument,
                          "unknown long flag") &&
         ExpectParseError({"-z"}, crypto::ErrorKind::kInvalidArgument, "unknown short flag") &&
         ExpectParseError({"--hex=yes"}, crypto::ErrorKind::kInvalidArgument,
                          "value on a switch") &&
         ExpectParseError({"extra"}, crypto::ErrorKind::kInvalidArgument, "positional");
}

}  // namespace

int main() {
  if (!TestDefaults()) {
    return EXIT_FAILURE;
  }
  if (!TestShortAndLongForms()) {
    return EXIT_FAILURE;
  }
  if (!TestBundledFlags()) {
    return EXIT_FAILURE;
  }
  if (!TestRejections()) {
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
