#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "config/language.hpp"

namespace s33d::crypto {

// Immutable 2048-entry BIP39 wordlist. Entries are NFKD-normalized UTF-8,
// unique, non-empty and free of whitespace.
class Wordlist {
 public:
  static constexpr std::size_t kSize = 2048;

  // Validates `words` and builds the reverse index. Throws
  // MnemonicError(kWordlistUnavailable) describing the first problem found.
  static Wordlist FromWords(config::Language language, std::vector<std::string> words);

  config::Language language() const { return language_; }
  std::size_t size() const { return words_.size(); }

  std::string_view Word(std::uint16_t index) const;
  std::optional<std::uint16_t> IndexOf(std::string_view word) const;
  bool Contains(std::string_view word) const { return IndexOf(word).has_value(); }

 private:
  Wordlist(config::Language language, std::vector<std::string> words);

  config::Language language_;
  std::vector<std::string> words_;
  std::unordered_map<std::string, std::uint16_t> index_;
};

// The embedded English list; built on first use and valid for the lifetime
// of the process.
const Wordlist& EnglishWordlist();

// Reads a BIP39 reference file (UTF-8, one word per line, optional trailing
// newline, CRLF tolerated) and normalizes every entry to NFKD.
Wordlist LoadWordlistFile(config::Language language, const std::filesystem::path& path);

// Per-process wordlist lookup keyed by language. English is served from the
// binary; other languages are read from `directory` once, on first request,
// and never change afterwards.
class WordlistRegistry {
 public:
  explicit WordlistRegistry(std::filesystem::path directory);

  WordlistRegistry(const WordlistRegistry&) = delete;
  WordlistRegistry& operator=(const WordlistRegistry&) = delete;

  const Wordlist& Get(config::Language language);
  const std::filesystem::path& directory() const { return directory_; }

 private:
  std::filesystem::path directory_;
  std::map<config::Language, std::unique_ptr<const Wordlist>> loaded_;
};

}  // namespace s33d::crypto
