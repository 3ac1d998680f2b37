#include "cli/options.hpp"

#include <charconv>
#include <stdexcept>
#include <string>
#include <system_error>

#include "config/language.hpp"
#include "crypto/entropy.hpp"
#include "crypto/mnemonic_error.hpp"

namespace s33d::cli {

namespace {

using crypto::ErrorKind;
using crypto::ThrowMnemonicError;

std::size_t ParseCount(std::string_view value, std::string_view what) {
  std::size_t parsed = 0;
  const auto* begin = value.data();
  const auto* end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (value.empty() || ec != std::errc() || ptr != end) {
    ThrowMnemonicError(ErrorKind::kInvalidArgument,
                       std::string(what) + " must be a valid number");
  }
  return parsed;
}

std::size_t ParseWords(std::string_view value) {
  const auto words = ParseCount(value, "word count");
  if (words != 12 && words != 24) {
    ThrowMnemonicError(ErrorKind::kInvalidWordCount,
                       "word count must be either 12 or 24. use 12 for good security or 24 "
                       "for maximum security.");
  }
  return words;
}

std::size_t ParseBits(std::string_view value) {
  const auto bits = ParseCount(value, "bits");
  for (const auto strength : crypto::kAllStrengths) {
    if (crypto::StrengthBits(strength) == bits) {
      return bits;
    }
  }
  ThrowMnemonicError(ErrorKind::kInvalidStrength,
                     "bits must be one of: 128, 160, 192, 224, or 256");
}

enum class OptionId {
  kWords,
  kBits,
  kLanguage,
  kDetails,
  kClean,
  kQr,
  kHex,
  kPassphrase,
  kSeed,
  kList,
  kHelp,
  kVersion,
  kWordlistDir,
  kDebugLog,
  kLogLevel,
};

struct OptionDef {
  OptionId id;
  char short_name;  // '\0' when the option has no short form
  std::string_view long_name;
  bool takes_value;
};

constexpr OptionDef kOptionDefs[] = {
    {OptionId::kWords, 'w', "words", true},
    {OptionId::kBits, 'b', "bits", true},
    {OptionId::kLanguage, 'l', "language", true},
    {OptionId::kDetails, 'e', "details", false},
    {OptionId::kClean, 'c', "clean", false},
    {OptionId::kQr, 'q', "qr", false},
    {OptionId::kHex, 'x', "hex", false},
    {OptionId::kPassphrase, 'p', "passphrase", false},
    {OptionId::kSeed, 's', "seed", false},
    {OptionId::kList, '\0', "list", false},
    {OptionId::kHelp, 'h', "help", false},
    {OptionId::kVersion, 'V', "version", false},
    {OptionId::kWordlistDir, '\0', "wordlist-dir", true},
    {OptionId::kDebugLog, '\0', "debug-log", true},
    {OptionId::kLogLevel, '\0', "log-level", true},
};

const OptionDef* FindShort(char name) {
  for (const auto& option : kOptionDefs) {
    if (option.short_name != '\0' && option.short_name == name) {
      return &option;
    }
  }
  return nullptr;
}

const OptionDef* FindLong(std::string_view name) {
  for (const auto& option : kOptionDefs) {
    if (option.long_name == name) {
      return &option;
    }
  }
  return nullptr;
}

void Apply(const OptionDef& option, std::string_view value, CliOptions* opts) {
  switch (option.id) {
    case OptionId::kWords:
      opts->words = ParseWords(value);
      break;
    case OptionId::kBits:
      opts->bits = ParseBits(value);
      break;
    case OptionId::kLanguage:
      (void)config::LanguageFromString(value);
      opts->language = std::string(value);
      break;
    case OptionId::kDetails:
      opts->show_details = true;
      break;
    case OptionId::kClean:
      opts->clean = true;
      break;
    case OptionId::kQr:
      opts->qr_code = true;
      break;
    case OptionId::kHex:
      opts->show_hex = true;
      break;
    case OptionId::kPassphrase:
      opts->passphrase = true;
      break;
    case OptionId::kSeed:
      opts->show_seed = true;
      break;
    case OptionId::kList:
      opts->list_languages = true;
      break;
    case OptionId::kHelp:
      opts->help = true;
      break;
    case OptionId::kVersion:
      opts->version = true;
      break;
    case OptionId::kWordlistDir:
      opts->wordlist_dir = std::string(value);
      break;
    case OptionId::kDebugLog:
      opts->debug_log = std::string(value);
      break;
    case OptionId::kLogLevel:
      try {
        opts->log_level = util::ParseLogLevel(value);
      } catch (const std::runtime_error& ex) {
        ThrowMnemonicError(ErrorKind::kInvalidArgument, ex.what());
      }
      break;
  }
}

std::string DisplayName(const OptionDef& option) {
  if (option.short_name != '\0') {
    return std::string("-") + option.short_name;
  }
  return "--" + std::string(option.long_name);
}

}  // namespace

CliOptions ParseOptions(int argc, char** argv) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    auto next_value = [&](const OptionDef& option) -> std::string_view {
      if (++i >= argc) {
        ThrowMnemonicError(ErrorKind::kInvalidArgument,
                           "missing value for " + DisplayName(option));
      }
      return argv[i];
    };

    if (arg.size() > 2 && arg.substr(0, 2) == "--") {
      auto name = arg.substr(2);
      std::optional<std::string_view> inline_value;
      if (const auto eq = name.find('='); eq != std::string_view::npos) {
        inline_value = name.substr(eq + 1);
        name = name.substr(0, eq);
      }
      const auto* option = FindLong(name);
      if (option == nullptr) {
        ThrowMnemonicError(ErrorKind::kInvalidArgument,
                           "unexpected argument '" + std::string(arg) + "'");
      }
      if (option->takes_value) {
        Apply(*option, inline_value ? *inline_value : next_value(*option), &opts);
      } else if (inline_value) {
        ThrowMnemonicError(ErrorKind::kInvalidArgument,
                           DisplayName(*option) + " does not take a value");
      } else {
        Apply(*option, {}, &opts);
      }
      continue;
    }

    if (arg.size() > 1 && arg[0] == '-' && arg[1] != '-') {
      for (std::size_t pos = 1; pos < arg.size(); ++pos) {
        const auto* option = FindShort(arg[pos]);
        if (option == nullptr) {
          ThrowMnemonicError(ErrorKind::kInvalidArgument,
                             "unexpected argument '-" + std::string(1, arg[pos]) + "'");
        }
        if (!option->takes_value) {
          Apply(*option, {}, &opts);
          continue;
        }
        auto attached = arg.substr(pos + 1);
        if (!attached.empty() && attached.front() == '=') {
          attached.remove_prefix(1);
        }
        Apply(*option, attached.empty() ? next_value(*option) : attached, &opts);
        break;
      }
      continue;
    }

    ThrowMnemonicError(ErrorKind::kInvalidArgument,
                       "unexpected argument '" + std::string(arg) + "'");
  }

  if (opts.words && opts.bits) {
    ThrowMnemonicError(ErrorKind::kInvalidArgument,
                       "the argument '-w <WORDS>' cannot be used with '-b <BITS>'");
  }
  return opts;
}

void PrintUsage(std::ostream& out) {
  out << "generate secure BIP39 seed phrases for your bitcoin wallet\n"
      << "\n"
      << "Usage: s33d [options]\n"
      << "\n"
      << "Options:\n"
      << "  -w <WORDS>              Number of words in the phrase (12 or 24)\n"
      << "  -l <LANGUAGE>           Language for mnemonic words [default: english]\n"
      << "  -e                      Show entropy and technical details\n"
      << "  -c                      Clean mode - only output the phrase\n"
      << "  -q                      Generate QR code for easy mobile import\n"
      << "  -x, --hex               Show entropy as hexadecimal\n"
      << "  -b <BITS>               Advanced: Entropy bits (128-256)\n"
      << "  -p, --passphrase        Advanced: Prompt for an optional BIP39 passphrase\n"
      << "  -s, --seed              Advanced: Show derived 64-byte seed as hexadecimal\n"
      << "      --list              List all supported languages\n"
      << "      --wordlist-dir <DIR>\n"
      << "                          Directory with the non-English BIP39 wordlists\n"
      << "                          (default: $S33D_WORDLIST_DIR or "
      << config::DefaultWordlistDir() << ")\n"
      << "      --debug-log <PATH>  Append diagnostics to PATH (or $S33D_DEBUG_LOG)\n"
      << "      --log-level <LEVEL> debug, info, warn or error [default: info]\n"
      << "  -h, --help              Print help\n"
      << "  -V, --version           Print version\n"
      << "\n"
      << "SECURITY WARNING: generated phrases provide access to funds.\n"
      << "store them securely and never share them online.\n";
}

}  // namespace s33d::cli
