#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "util/logging.hpp"

namespace s33d::cli {

inline constexpr std::string_view kVersion = "0.3.0";

struct CliOptions {
  std::optional<std::size_t> words;
  std::optional<std::size_t> bits;
  std::string language{"english"};
  bool show_details{false};
  bool clean{false};
  bool qr_code{false};
  bool show_hex{false};
  bool passphrase{false};
  bool show_seed{false};
  bool list_languages{false};
  bool help{false};
  bool version{false};
  std::string wordlist_dir;
  std::string debug_log;
  std::optional<util::LogLevel> log_level;
};

// Parses argv. Short flags may be bundled (-ecx) and short values attached
// (-w24); long values may use --name=value. Throws crypto::MnemonicError:
// kInvalidArgument for unknown flags, missing or non-numeric values and the
// -w/-b conflict, kInvalidWordCount for -w other than 12 or 24,
// kInvalidStrength for unsupported -b values and kUnsupportedLanguage for
// an unknown -l.
CliOptions ParseOptions(int argc, char** argv);

void PrintUsage(std::ostream& out);

}  // namespace s33d::cli
