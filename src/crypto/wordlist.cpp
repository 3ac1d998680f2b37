#include "crypto/wordlist.hpp"

#include <cctype>
#include <fstream>
#include <utility>

#include "crypto/mnemonic_error.hpp"
#include "crypto/mnemonic_wordlist_en.hpp"
#include "util/logging.hpp"
#include "util/unicode.hpp"

namespace s33d::crypto {

namespace {

bool HasAsciiWhitespace(std::string_view word) {
  for (const char ch : word) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      return true;
    }
  }
  return false;
}

[[noreturn]] void ThrowWordlistError(config::Language language, const std::string& detail) {
  ThrowMnemonicError(ErrorKind::kWordlistUnavailable,
                     std::string(config::LanguageName(language)) + " wordlist " + detail);
}

}  // namespace

Wordlist::Wordlist(config::Language language, std::vector<std::string> words)
    : language_(language), words_(std::move(words)) {
  index_.reserve(words_.size());
  for (std::size_t i = 0; i < words_.size(); ++i) {
    index_.emplace(words_[i], static_cast<std::uint16_t>(i));
  }
}

Wordlist Wordlist::FromWords(config::Language language, std::vector<std::string> words) {
  if (words.size() != kSize) {
    ThrowWordlistError(language, "has " + std::to_string(words.size()) +
                                     " entries, expected " + std::to_string(kSize));
  }
  for (std::size_t i = 0; i < words.size(); ++i) {
    if (words[i].empty()) {
      ThrowWordlistError(language, "entry " + std::to_string(i) + " is empty");
    }
    if (HasAsciiWhitespace(words[i])) {
      ThrowWordlistError(language, "entry " + std::to_string(i) + " contains whitespace");
    }
    if (!util::IsValidUtf8(words[i])) {
      ThrowWordlistError(language, "entry " + std::to_string(i) + " is not valid UTF-8");
    }
  }
  Wordlist list(language, std::move(words));
  if (list.index_.size() != kSize) {
    ThrowWordlistError(language, "contains duplicate entries");
  }
  return list;
}

std::string_view Wordlist::Word(std::uint16_t index) const {
  if (index >= words_.size()) {
    ThrowMnemonicError(ErrorKind::kMnemonicEncodingFailure, "word index out of range");
  }
  return words_[index];
}

std::optional<std::uint16_t> Wordlist::IndexOf(std::string_view word) const {
  const auto it = index_.find(std::string(word));
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

const Wordlist& EnglishWordlist() {
  static const Wordlist wordlist = [] {
    std::vector<std::string> words;
    words.reserve(kEnglishMnemonicWordlistEn.size());
    for (const auto word : kEnglishMnemonicWordlistEn) {
      words.emplace_back(word);
    }
    return Wordlist::FromWords(config::Language::kEnglish, std::move(words));
  }();
  return wordlist;
}

Wordlist LoadWordlistFile(config::Language language, const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    ThrowWordlistError(language, "file not found: " + path.string());
  }
  std::vector<std::string> words;
  words.reserve(Wordlist::kSize);
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    // Strip a UTF-8 byte order mark on the first line.
    if (line_number == 1 && line.rfind("\xEF\xBB\xBF", 0) == 0) {
      line.erase(0, 3);
    }
    util::SecureString normalized;
    std::string error;
    if (!util::NormalizeNfkd(line, &normalized, &error)) {
      ThrowWordlistError(language, "line " + std::to_string(line_number) + ": " + error);
    }
    words.emplace_back(normalized.view());
  }
  if (in.bad()) {
    ThrowWordlistError(language, "read error: " + path.string());
  }
  return Wordlist::FromWords(language, std::move(words));
}

WordlistRegistry::WordlistRegistry(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

const Wordlist& WordlistRegistry::Get(config::Language language) {
  if (language == config::Language::kEnglish) {
    return EnglishWordlist();
  }
  auto it = loaded_.find(language);
  if (it != loaded_.end()) {
    return *it->second;
  }
  const auto& info = config::GetLanguageInfo(language);
  const auto path = directory_ / std::string(info.wordlist_file);
  auto list = std::make_unique<const Wordlist>(LoadWordlistFile(language, path));
  util::LogDebug("loaded " + std::string(info.name) + " wordlist from " + path.string());
  const Wordlist& ref = *list;
  loaded_.emplace(language, std::move(list));
  return ref;
}

}  // namespace s33d::crypto
