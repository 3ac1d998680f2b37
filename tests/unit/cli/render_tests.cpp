#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cli/qr_render.hpp"
#include "cli/render.hpp"
#include "config/language.hpp"
#include "crypto/mnemonic.hpp"
#include "crypto/mnemonic_error.hpp"
#include "crypto/wordlist.hpp"
#include "tests/unit/util/test_entropy.hpp"
#include "util/unicode.hpp"
#include "wallet/seed_generator.hpp"

namespace {

using namespace s33d;

constexpr std::size_t kBoxColumns = cli::kBoxInnerWidth + 4;

std::vector<std::string> Lines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

bool IsBoxLine(std::string_view line) {
  return line.rfind("┌", 0) == 0 || line.rfind("│", 0) == 0 || line.rfind("└", 0) == 0;
}

// Every box line in `text` must span exactly `columns` display columns.
bool RequireBoxWidth(const std::string& text, std::size_t columns, const char* label) {
  std::size_t checked = 0;
  for (const auto& line : Lines(text)) {
    if (!IsBoxLine(line)) {
      continue;
    }
    ++checked;
    if (util::DisplayWidth(line) != columns) {
      std::cerr << label << ": line is " << util::DisplayWidth(line) << " columns wide, expected "
                << columns << ":\n" << line << "\n";
      return false;
    }
  }
  if (checked == 0) {
    std::cerr << label << ": no box lines rendered\n";
    return false;
  }
  return true;
}

// One CJK ideograph per entry, starting at U+4E00.
crypto::Wordlist WideWordlist(config::Language language, char32_t first) {
  std::vector<std::string> words;
  for (char32_t i = 0; i < crypto::Wordlist::kSize; ++i) {
    const char32_t cp = first + i;
    std::string word;
    word.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    word.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    word.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    words.push_back(word);
  }
  return crypto::Wordlist::FromWords(language, std::move(words));
}

bool TestDisplayWidth() {
  struct Case {
    std::string_view text;
    std::size_t width;
  };
  const Case cases[] = {
      {"", 0},
      {"abandon", 7},
      {"\xE7\xAE\x80\xE4\xBD\x93", 4},           // 简体
      {"\xED\x95\x9C\xEA\xB5\xAD\xEC\x96\xB4", 6},  // 한국어
      {"cafe\xCC\x81", 4},                         // e + combining acute
      {"\xE2\x94\x80", 1},                         // box drawing
      {"\xEF\xBC\xA1", 2},                         // fullwidth A
  };
  for (const auto& c : cases) {
    if (util::DisplayWidth(c.text) != c.width) {
      std::cerr << "DisplayWidth('" << c.text << "') = " << util::DisplayWidth(c.text)
                << ", expected " << c.width << "\n";
      return false;
    }
  }
  return true;
}

bool TestFixedBoxes() {
  std::ostringstream out;
  out << cli::BoxTop("supported languages") << "\n" << cli::BoxBottom() << "\n";
  cli::PrintErrorBox(out, "passphrases do not match");
  cli::PrintWarningBox(out, "system entropy source (/dev/urandom) not found");
  if (!RequireBoxWidth(out.str(), kBoxColumns, "fixed boxes")) {
    return false;
  }
  const auto lines = Lines(out.str());
  if (lines[2] != "┌─ ERROR ─────────────────────────────────────────────────────────┐" ||
      lines[3].rfind("│ ✗ passphrases do not match", 0) != 0) {
    std::cerr << "error box layout changed:\n" << out.str();
    return false;
  }
  return true;
}

bool TestLanguageList() {
  std::ostringstream out;
  cli::PrintLanguageList(out);
  const auto text = out.str();
  if (!RequireBoxWidth(text, kBoxColumns, "language list")) {
    return false;
  }
  if (text.find("│ chinese-simplified   (cn)  - 简体中文") == std::string::npos ||
      text.find("│ english              (en)  - default, widely supported") ==
          std::string::npos ||
      text.find("  s33d -l ja -w 24") == std::string::npos) {
    std::cerr << "language table contents wrong:\n" << text;
    return false;
  }
  return true;
}

bool TestEnglishGridIsColumnMajor() {
  const auto entropy = test::Bytes(16, 0x00);
  const auto phrase = crypto::EncodeMnemonic(entropy, crypto::EnglishWordlist());
  std::ostringstream out;
  cli::PrintPhraseGrid(out, phrase);
  const auto text = out.str();
  if (!RequireBoxWidth(text, kBoxColumns, "12-word grid")) {
    return false;
  }
  const auto lines = Lines(text);
  // header, three rows, footer
  if (lines.size() != 5 || lines[0].find("your 12 word seed phrase") == std::string::npos) {
    std::cerr << "unexpected grid shape:\n" << text;
    return false;
  }
  const auto first = lines[1].find("1. abandon");
  const auto fourth = lines[1].find("4. abandon");
  const auto tenth = lines[1].find("10. abandon");
  if (first == std::string::npos || fourth == std::string::npos || tenth == std::string::npos ||
      !(first < fourth && fourth < tenth) || lines[3].find("12. about") == std::string::npos) {
    std::cerr << "grid is not filled column by column:\n" << text;
    return false;
  }
  return true;
}

bool TestGridSizesAndWideWords() {
  for (const auto strength : crypto::kAllStrengths) {
    const auto entropy = test::Bytes(crypto::EntropyBytes(strength), 0xFF);
    const auto phrase = crypto::EncodeMnemonic(entropy, crypto::EnglishWordlist());
    std::ostringstream out;
    cli::PrintPhraseGrid(out, phrase);
    if (!RequireBoxWidth(out.str(), kBoxColumns, "english grid")) {
      return false;
    }
  }
  const auto chinese = WideWordlist(config::Language::kChineseSimplified, 0x4E00);
  const auto entropy = test::Bytes(32, 0x3C);
  const auto phrase = crypto::EncodeMnemonic(entropy, chinese);
  std::ostringstream out;
  cli::PrintPhraseGrid(out, phrase);
  return RequireBoxWidth(out.str(), kBoxColumns, "wide-character grid");
}

bool TestKoreanPlainList() {
  const auto korean = WideWordlist(config::Language::kKorean, 0xAC00);
  const auto entropy = test::Bytes(16, 0x00);
  const auto phrase = crypto::EncodeMnemonic(entropy, korean);
  std::ostringstream out;
  cli::PrintPhraseGrid(out, phrase);
  const auto lines = Lines(out.str());
  // "가" is the first Hangul syllable, "갃" the fourth.
  if (lines.size() < 14 || lines[0] != "your 12 word seed phrase" || lines[2] != "1. 가" ||
      lines[13] != "12. 갃") {
    std::cerr << "korean phrase not printed as a plain list:\n" << out.str();
    return false;
  }
  for (const auto& line : lines) {
    if (IsBoxLine(line)) {
      std::cerr << "korean output contains box drawing\n";
      return false;
    }
  }
  return true;
}

wallet::GeneratedMnemonic ZeroMnemonic() {
  auto entropy = util::SecureBytes(test::Bytes(16, 0x00));
  auto phrase = crypto::EncodeMnemonic(entropy.span(), crypto::EnglishWordlist());
  return wallet::GeneratedMnemonic{crypto::EntropyStrength::k128, std::move(entropy),
                                   std::move(phrase)};
}

bool TestDecoratedReport() {
  const auto generated = ZeroMnemonic();
  const auto seed = crypto::DeriveSeed(generated.phrase, "");
  cli::DisplayOptions options;
  options.technical_details = true;
  options.show_hex = true;
  options.show_seed = true;
  std::ostringstream out;
  cli::PrintDecorated(out, generated, &seed, options);
  const auto text = out.str();
  if (!RequireBoxWidth(text, kBoxColumns, "decorated report")) {
    return false;
  }
  const char* expected[] = {
      "┌─ s33d: bip39 mnemonic generator ─",
      "│ ▪ entropy bits    : 128 bits",
      "│ ▪ checksum bits   :   4 bits",
      "│ ▪ total bits      : 132 bits",
      "│ ▪ word count      :  12 words",
      "│ ▪ language        : english",
      "│ 00000000000000000000000000000000",
      "│ 5eb00bbddcf069084889a8ab91555681",
      "│ 9a5ac40b389cd370d086206dec8aa6c4",
      "┌─ security warnings ─",
      "│ ✓ checksum validation passed",
  };
  for (const char* needle : expected) {
    if (text.find(needle) == std::string::npos) {
      std::cerr << "decorated report is missing '" << needle << "'\n" << text;
      return false;
    }
  }
  return true;
}

bool TestCleanOutput() {
  const auto generated = ZeroMnemonic();
  const auto seed = crypto::DeriveSeed(generated.phrase, "");
  cli::DisplayOptions options;
  std::ostringstream plain;
  cli::PrintClean(plain, generated, &seed, options);
  if (plain.str() != test::Repeat("abandon", 12, "about") + "\n") {
    std::cerr << "clean output without extras is wrong: " << plain.str();
    return false;
  }
  options.show_hex = true;
  options.show_seed = true;
  std::ostringstream full;
  cli::PrintClean(full, generated, &seed, options);
  const auto lines = Lines(full.str());
  if (lines.size() != 3 || lines[1] != "hex: 00000000000000000000000000000000" ||
      lines[2].rfind("seed: 5eb00bbddcf06908", 0) != 0 || lines[2].size() != 6 + 128) {
    std::cerr << "clean output with extras is wrong:\n" << full.str();
    return false;
  }
  return true;
}

bool TestQrHalfBlocks() {
  // 2x2 matrix: top row dark/light, bottom row dark/dark.
  const cli::QrMatrix matrix(2, {1, 0, 1, 1});
  std::ostringstream out;
  cli::PrintQrMatrix(out, matrix);
  const auto text = out.str();
  if (!RequireBoxWidth(text, kBoxColumns, "qr box") ||
      text.find("  █▄  ") == std::string::npos ||
      text.find("┌─ qr code for mobile import ─") == std::string::npos) {
    std::cerr << "qr rendering wrong:\n" << text;
    return false;
  }

  const auto sentence = test::Repeat("abandon", 12, "about");
  if (!cli::QrSupported()) {
    try {
      std::ostringstream ignored;
      cli::PrintQrCode(ignored, sentence);
      std::cerr << "QR output claimed success without libqrencode\n";
      return false;
    } catch (const crypto::MnemonicError& ex) {
      return ex.kind == crypto::ErrorKind::kQrUnavailable;
    }
  }
  cli::QrMatrix encoded;
  std::string error;
  if (!cli::EncodeQr(sentence, &encoded, &error) || encoded.width() < 21 ||
      (encoded.width() - 17) % 4 != 0) {
    std::cerr << "QR encoding failed: " << error << "\n";
    return false;
  }
  std::ostringstream phrase_qr;
  cli::PrintQrCode(phrase_qr, sentence);
  return RequireBoxWidth(phrase_qr.str(), kBoxColumns, "phrase qr");
}

}  // namespace

int main() {
  if (!TestDisplayWidth()) {
    return EXIT_FAILURE;
  }
  if (!TestFixedBoxes()) {
    return EXIT_FAILURE;
  }
  if (!TestLanguageList()) {
    return EXIT_FAILURE;
  }
  if (!TestEnglishGridIsColumnMajor()) {
    return EXIT_FAILURE;
  }
  if (!TestGridSizesAndWideWords()) {
    return EXIT_FAILURE;
  }
  if (!TestKoreanPlainList()) {
    return EXIT_FAILURE;
  }
  if (!TestDecoratedReport()) {
    return EXIT_FAILURE;
  }
  if (!TestCleanOutput()) {
    return EXIT_FAILURE;
  }
  if (!TestQrHalfBlocks()) {
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
