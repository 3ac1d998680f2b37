#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

#include "crypto/mnemonic.hpp"
#include "wallet/seed_generator.hpp"

namespace s33d::cli {

// Columns between the two vertical box borders, excluding the one-space
// margin on each side.
inline constexpr std::size_t kBoxInnerWidth = 63;
inline constexpr std::size_t kWordGridColumns = 4;

// "┌─ title ───┐" spanning inner_width + 4 display columns.
std::string BoxTop(std::string_view title, std::size_t inner_width = kBoxInnerWidth);
std::string BoxBottom(std::size_t inner_width = kBoxInnerWidth);
// "│ content<pad> │". Content wider than inner_width is printed unpadded.
void PrintBoxLine(std::ostream& out, std::string_view content,
                  std::size_t inner_width = kBoxInnerWidth);

void PrintErrorBox(std::ostream& out, std::string_view message);
void PrintWarningBox(std::ostream& out, std::string_view message);

// Language table, compatibility note and usage examples for --list.
void PrintLanguageList(std::ostream& out);

struct DisplayOptions {
  bool technical_details{false};
  bool show_hex{false};
  bool show_seed{false};
};

// Phrase box: a 4-column numbered grid filled column by column. Korean is
// printed as a plain numbered list instead.
void PrintPhraseGrid(std::ostream& out, const crypto::MnemonicPhrase& phrase);

// Full decorated report. `seed` may be null when no seed was derived.
void PrintDecorated(std::ostream& out, const wallet::GeneratedMnemonic& generated,
                    const crypto::Seed* seed, const DisplayOptions& options);

// Clean mode: the phrase on one line, then optional "hex:" and "seed:"
// lines.
void PrintClean(std::ostream& out, const wallet::GeneratedMnemonic& generated,
                const crypto::Seed* seed, const DisplayOptions& options);

}  // namespace s33d::cli
