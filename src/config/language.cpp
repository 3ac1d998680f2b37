#include "config/language.hpp"

#include <array>
#include <cctype>
#include <cstdlib>

#include "crypto/mnemonic_error.hpp"

#ifndef S33D_DEFAULT_WORDLIST_DIR
#define S33D_DEFAULT_WORDLIST_DIR "/usr/local/share/s33d/wordlists"
#endif

namespace s33d::config {

namespace {

constexpr std::array<LanguageInfo, 10> kLanguages{{
    {Language::kEnglish, "english", "(en)", "- default, widely supported", "english.txt"},
    {Language::kChineseSimplified, "chinese-simplified", "(cn)", "- 简体中文",
     "chinese_simplified.txt"},
    {Language::kChineseTraditional, "chinese-traditional", "(tw)", "- 繁體中文",
     "chinese_traditional.txt"},
    {Language::kFrench, "french", "(fr)", "- français", "french.txt"},
    {Language::kItalian, "italian", "(it)", "- italiano", "italian.txt"},
    {Language::kJapanese, "japanese", "(ja)", "- 日本語", "japanese.txt"},
    {Language::kKorean, "korean", "(ko)", "- 한국어", "korean.txt"},
    {Language::kSpanish, "spanish", "(es)", "- español", "spanish.txt"},
    {Language::kCzech, "czech", "(cs)", "- čeština", "czech.txt"},
    {Language::kPortuguese, "portuguese", "(pt)", "- português", "portuguese.txt"},
}};

std::string LowercaseAscii(std::string_view input) {
  std::string out(input);
  for (char& ch : out) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return out;
}

}  // namespace

std::span<const LanguageInfo> SupportedLanguages() { return kLanguages; }

const LanguageInfo& GetLanguageInfo(Language language) {
  for (const auto& info : kLanguages) {
    if (info.language == language) {
      return info;
    }
  }
  return kLanguages.front();
}

std::string_view LanguageName(Language language) { return GetLanguageInfo(language).name; }

Language LanguageFromString(std::string_view name) {
  const std::string lower = LowercaseAscii(name);
  if (lower == "english" || lower == "en") return Language::kEnglish;
  if (lower == "chinese-simplified" || lower == "cn" || lower == "zh-cn") {
    return Language::kChineseSimplified;
  }
  if (lower == "chinese-traditional" || lower == "tw" || lower == "zh-tw") {
    return Language::kChineseTraditional;
  }
  if (lower == "french" || lower == "fr") return Language::kFrench;
  if (lower == "italian" || lower == "it") return Language::kItalian;
  if (lower == "japanese" || lower == "ja" || lower == "jp") return Language::kJapanese;
  if (lower == "korean" || lower == "ko" || lower == "kr") return Language::kKorean;
  if (lower == "spanish" || lower == "es") return Language::kSpanish;
  if (lower == "czech" || lower == "cs") return Language::kCzech;
  if (lower == "portuguese" || lower == "pt") return Language::kPortuguese;
  crypto::ThrowMnemonicError(crypto::ErrorKind::kUnsupportedLanguage,
                             "unsupported language. use --list to see available options.");
}

std::string DefaultWordlistDir() {
  const char* value = std::getenv("S33D_WORDLIST_DIR");
  if (value != nullptr && value[0] != '\0') {
    return value;
  }
  return S33D_DEFAULT_WORDLIST_DIR;
}

}  // namespace s33d::config
