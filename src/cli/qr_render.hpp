#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace s33d::cli {

// Square module matrix without quiet zone; 1 marks a dark module. The
// matrix encodes the phrase, so it is wiped on destruction.
class QrMatrix {
 public:
  QrMatrix() = default;
  QrMatrix(std::size_t width, std::vector<std::uint8_t> modules);
  QrMatrix(QrMatrix&&) noexcept = default;
  QrMatrix& operator=(QrMatrix&&) noexcept = default;
  ~QrMatrix();

  std::size_t width() const { return width_; }
  bool Dark(std::size_t x, std::size_t y) const { return modules_[y * width_ + x] != 0; }

 private:
  std::size_t width_{0};
  std::vector<std::uint8_t> modules_;
};

// True when the binary was built with libqrencode.
bool QrSupported();

// Byte-mode encoding at error correction level L, smallest fitting version.
bool EncodeQr(std::string_view text, QrMatrix* out, std::string* error = nullptr);

// Boxed half-block rendering: two module rows per line, two-module quiet
// zone, box inner width at least 63 columns.
void PrintQrMatrix(std::ostream& out, const QrMatrix& matrix);

// Encodes and prints `text`. Throws MnemonicError(kQrUnavailable) when QR
// support is not compiled in; an encoding failure prints an error box.
void PrintQrCode(std::ostream& out, std::string_view text);

}  // namespace s33d::cli
