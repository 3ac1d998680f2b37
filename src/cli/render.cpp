#include "cli/render.hpp"

#include <algorithm>
#include <array>
#include <initializer_list>
#include <span>
#include <string>
#include <vector>

#include "config/language.hpp"
#include "util/hex.hpp"
#include "util/secure_buffer.hpp"
#include "util/unicode.hpp"

namespace s33d::cli {

namespace {

constexpr std::size_t kHexChunkChars = 32;
constexpr std::string_view kGridSeparator = "   ";

std::string Repeat(std::string_view piece, std::size_t count) {
  std::string out;
  out.reserve(piece.size() * count);
  for (std::size_t i = 0; i < count; ++i) {
    out.append(piece);
  }
  return out;
}

void PrintFixedBox(std::ostream& out, std::string_view title,
                   std::initializer_list<std::string_view> lines) {
  out << BoxTop(title) << "\n";
  for (const auto line : lines) {
    PrintBoxLine(out, line);
  }
  out << BoxBottom() << "\n";
}

void PrintHexBox(std::ostream& out, std::string_view title, std::span<const std::uint8_t> bytes) {
  const auto hex = util::HexEncodeSecret(bytes);
  const std::string_view text = hex.view();
  out << "\n" << BoxTop(title) << "\n";
  for (std::size_t pos = 0; pos < text.size(); pos += kHexChunkChars) {
    PrintBoxLine(out, text.substr(pos, kHexChunkChars));
  }
  out << BoxBottom() << "\n";
}

// "  1" style right alignment used in the technical details box.
std::string RightAlign(std::size_t value, std::size_t width) {
  std::string text = std::to_string(value);
  if (text.size() < width) {
    text.insert(0, width - text.size(), ' ');
  }
  return text;
}

util::SecureString NumberedItem(std::size_t number, std::string_view word) {
  util::SecureString item;
  item.Append(std::to_string(number));
  item.Append(". ");
  item.Append(word);
  return item;
}

void PrintKoreanList(std::ostream& out, const std::vector<std::string_view>& words) {
  out << "your " << words.size() << " word seed phrase\n\n";
  for (std::size_t i = 0; i < words.size(); ++i) {
    out << (i + 1) << ". " << words[i] << "\n";
  }
  out << "\n";
}

}  // namespace

std::string BoxTop(std::string_view title, std::size_t inner_width) {
  std::string top = "┌─ ";
  top.append(title);
  top.push_back(' ');
  const std::size_t used = 4 + util::DisplayWidth(title);
  const std::size_t total = inner_width + 4;
  top.append(Repeat("─", total > used + 1 ? total - used - 1 : 0));
  top.append("┐");
  return top;
}

std::string BoxBottom(std::size_t inner_width) {
  return "└" + Repeat("─", inner_width + 2) + "┘";
}

void PrintBoxLine(std::ostream& out, std::string_view content, std::size_t inner_width) {
  const std::size_t width = util::DisplayWidth(content);
  out << "│ " << content;
  if (width < inner_width) {
    out << std::string(inner_width - width, ' ');
  }
  out << " │\n";
}

void PrintErrorBox(std::ostream& out, std::string_view message) {
  std::string line = "✗ ";
  line.append(message);
  PrintFixedBox(out, "ERROR", {line});
}

void PrintWarningBox(std::ostream& out, std::string_view message) {
  std::string line = "⚠ ";
  line.append(message);
  PrintFixedBox(out, "WARNING", {line});
}

void PrintLanguageList(std::ostream& out) {
  const auto languages = config::SupportedLanguages();
  std::size_t name_width = 0;
  std::size_t code_width = 0;
  for (const auto& info : languages) {
    name_width = std::max(name_width, util::DisplayWidth(info.name));
    code_width = std::max(code_width, util::DisplayWidth(info.code));
  }

  out << "\n" << BoxTop("supported languages") << "\n";
  for (const auto& info : languages) {
    std::string line(info.name);
    line.append(name_width - util::DisplayWidth(info.name), ' ');
    line.append("  ");
    line.append(info.code);
    line.append(code_width - util::DisplayWidth(info.code), ' ');
    line.append("  ");
    line.append(info.description);
    PrintBoxLine(out, line);
  }
  out << BoxBottom() << "\n\n";
  PrintFixedBox(out, "compatibility note",
                {"▪ english is the most widely supported language",
                 "▪ other languages may have limited wallet support",
                 "▪ when in doubt, use english"});
  out << "\n"
      << "usage:\n"
      << "  s33d -l english\n"
      << "  s33d -l ja -w 24\n"
      << "\n";
}

void PrintPhraseGrid(std::ostream& out, const crypto::MnemonicPhrase& phrase) {
  const auto words = phrase.Words();
  if (phrase.language() == config::Language::kKorean) {
    PrintKoreanList(out, words);
    return;
  }

  const std::size_t rows = (words.size() + kWordGridColumns - 1) / kWordGridColumns;
  std::vector<util::SecureString> items;
  items.reserve(words.size());
  for (std::size_t i = 0; i < words.size(); ++i) {
    items.push_back(NumberedItem(i + 1, words[i]));
  }

  std::array<std::size_t, kWordGridColumns> column_widths{};
  for (std::size_t i = 0; i < items.size(); ++i) {
    auto& column = column_widths[i / rows];
    column = std::max(column, util::DisplayWidth(items[i].view()));
  }

  // Spread any slack across the separators so the box is at least
  // kBoxInnerWidth wide; the leftmost separators take the remainder.
  std::size_t required = kGridSeparator.size() * (kWordGridColumns - 1);
  for (const auto width : column_widths) {
    required += width;
  }
  const std::size_t final_width = std::max(required, kBoxInnerWidth);
  const std::size_t slack = final_width - required;
  constexpr std::size_t kSeparators = kWordGridColumns - 1;
  std::array<std::string, kSeparators> separators;
  for (std::size_t i = 0; i < kSeparators; ++i) {
    const std::size_t extra = slack / kSeparators + (i < slack % kSeparators ? 1 : 0);
    separators[i] = std::string(kGridSeparator) + std::string(extra, ' ');
  }

  out << BoxTop("your " + std::to_string(words.size()) + " word seed phrase", final_width)
      << "\n";
  util::SecureString line;
  for (std::size_t row = 0; row < rows; ++row) {
    line.Clear();
    for (std::size_t col = 0; col < kWordGridColumns; ++col) {
      const std::size_t index = row + col * rows;
      std::size_t width = 0;
      if (index < items.size()) {
        line.Append(items[index].view());
        width = util::DisplayWidth(items[index].view());
      }
      line.Append(std::string(column_widths[col] - width, ' '));
      if (col < kSeparators) {
        line.Append(separators[col]);
      }
    }
    out << "│ " << line.view() << " │\n";
  }
  out << BoxBottom(final_width) << "\n";
}

void PrintDecorated(std::ostream& out, const wallet::GeneratedMnemonic& generated,
                    const crypto::Seed* seed, const DisplayOptions& options) {
  const std::size_t bits = crypto::StrengthBits(generated.strength);
  const std::size_t checksum = crypto::ChecksumBits(generated.strength);

  out << "\n";
  PrintFixedBox(out, "s33d: bip39 mnemonic generator",
                {"cryptographically secure seed phrase generation"});

  if (options.technical_details) {
    const std::string entropy_line = "▪ entropy bits    : " + RightAlign(bits, 3) + " bits";
    const std::string checksum_line =
        "▪ checksum bits   : " + RightAlign(checksum, 3) + " bits";
    const std::string total_line =
        "▪ total bits      : " + RightAlign(bits + checksum, 3) + " bits";
    const std::string words_line =
        "▪ word count      : " + RightAlign(crypto::WordCount(generated.strength), 3) +
        " words";
    const std::string language_line =
        "▪ language        : " + std::string(config::LanguageName(generated.phrase.language()));
    out << "\n";
    PrintFixedBox(out, "technical details",
                  {entropy_line, checksum_line, total_line, words_line, language_line});
  }

  if (options.show_hex) {
    PrintHexBox(out, "entropy (hexadecimal)", generated.entropy.span());
  }
  if (options.show_seed && seed != nullptr) {
    PrintHexBox(out, "master seed (hexadecimal)", seed->span());
  }

  out << "\n";
  PrintPhraseGrid(out, generated.phrase);

  out << "\n";
  PrintFixedBox(out, "security warnings",
                {"▲ critical: write this phrase on paper - NEVER store digitally",
                 "▲ keep in a secure location away from others",
                 "▲ anyone with this phrase can access your cryptocurrency",
                 "▲ verify the first few words before final storage",
                 "▲ never enter this phrase on websites or untrusted devices",
                 "▲ consider hardware wallets for significant amounts"});
  out << "\n";
  PrintFixedBox(out, "generation status",
                {"✓ phrase generated using cryptographically secure entropy",
                 "✓ bip39 standard compliance verified",
                 "✓ checksum validation passed"});
  out << "\n";
}

void PrintClean(std::ostream& out, const wallet::GeneratedMnemonic& generated,
                const crypto::Seed* seed, const DisplayOptions& options) {
  out << generated.phrase.Sentence() << "\n";
  if (options.show_hex) {
    const auto hex = util::HexEncodeSecret(generated.entropy.span());
    out << "hex: " << hex.view() << "\n";
  }
  if (options.show_seed && seed != nullptr) {
    const auto hex = util::HexEncodeSecret(seed->span());
    out << "seed: " << hex.view() << "\n";
  }
}

}  // namespace s33d::cli
