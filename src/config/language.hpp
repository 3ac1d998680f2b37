#pragma once

#include <span>
#include <string>
#include <string_view>

namespace s33d::config {

enum class Language {
  kEnglish,
  kChineseSimplified,
  kChineseTraditional,
  kFrench,
  kItalian,
  kJapanese,
  kKorean,
  kSpanish,
  kCzech,
  kPortuguese,
};

struct LanguageInfo {
  Language language{Language::kEnglish};
  std::string_view name;           // canonical flag value, e.g. "chinese-simplified"
  std::string_view code;           // short code as printed by --list, e.g. "(cn)"
  std::string_view description;    // native-script note for --list
  std::string_view wordlist_file;  // BIP39 reference file name
};

// All supported languages in display order (english first).
std::span<const LanguageInfo> SupportedLanguages();

const LanguageInfo& GetLanguageInfo(Language language);
std::string_view LanguageName(Language language);

// Case-insensitive lookup by canonical name, code or alias. Throws
// crypto::MnemonicError(kUnsupportedLanguage) for anything unknown.
Language LanguageFromString(std::string_view name);

// Directory holding the non-English wordlist files. Resolution order:
// S33D_WORDLIST_DIR environment variable, then the compiled-in default.
std::string DefaultWordlistDir();

}  // namespace s33d::config
