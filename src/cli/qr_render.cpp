#include "cli/qr_render.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#ifdef S33D_HAVE_QRENCODE
#include <qrencode.h>
#endif

#include "cli/render.hpp"
#include "crypto/mnemonic_error.hpp"
#include "util/logging.hpp"
#include "util/secure_buffer.hpp"
#include "util/secure_wipe.hpp"

namespace s33d::cli {

namespace {

constexpr std::size_t kQuietZoneModules = 2;
constexpr std::size_t kVerticalPaddingLines = kQuietZoneModules / 2;
constexpr std::string_view kQrTitle = "qr code for mobile import";

}  // namespace

QrMatrix::QrMatrix(std::size_t width, std::vector<std::uint8_t> modules)
    : width_(width), modules_(std::move(modules)) {}

QrMatrix::~QrMatrix() { util::SecureWipe(modules_); }

bool QrSupported() {
#ifdef S33D_HAVE_QRENCODE
  return true;
#else
  return false;
#endif
}

bool EncodeQr(std::string_view text, QrMatrix* out, std::string* error) {
#ifdef S33D_HAVE_QRENCODE
  // QRcode_encodeString needs a terminated copy.
  util::SecureString terminated(text);
  QRcode* code = QRcode_encodeString(terminated.c_str(), 0, QR_ECLEVEL_L, QR_MODE_8, 1);
  if (code == nullptr) {
    if (error) {
      *error = errno == ERANGE ? "data too long" : std::strerror(errno);
    }
    return false;
  }
  const auto width = static_cast<std::size_t>(code->width);
  std::vector<std::uint8_t> modules(width * width);
  for (std::size_t i = 0; i < modules.size(); ++i) {
    modules[i] = static_cast<std::uint8_t>(code->data[i] & 0x01u);
  }
  util::SecureWipe(code->data, width * width);
  QRcode_free(code);
  *out = QrMatrix(width, std::move(modules));
  return true;
#else
  (void)text;
  (void)out;
  if (error) {
    *error = "QR support not compiled in";
  }
  return false;
#endif
}

void PrintQrMatrix(std::ostream& out, const QrMatrix& matrix) {
  const std::size_t width = matrix.width();
  const std::size_t qr_columns = width + kQuietZoneModules * 2;
  const std::size_t inner = qr_columns > kBoxInnerWidth ? qr_columns : kBoxInnerWidth;
  const std::size_t total_padding = inner - qr_columns;
  const std::string left(total_padding / 2, ' ');
  const std::string right(total_padding - total_padding / 2, ' ');
  const std::string quiet(kQuietZoneModules, ' ');
  const std::string empty_line(qr_columns, ' ');

  out << "\n" << BoxTop(kQrTitle, inner) << "\n";
  for (std::size_t i = 0; i < kVerticalPaddingLines; ++i) {
    out << "│ " << left << empty_line << right << " │\n";
  }
  util::SecureString line;
  for (std::size_t y = 0; y < width; y += 2) {
    line.Clear();
    line.Append(quiet);
    for (std::size_t x = 0; x < width; ++x) {
      const bool top = matrix.Dark(x, y);
      const bool bottom = y + 1 < width && matrix.Dark(x, y + 1);
      if (top && bottom) {
        line.Append("█");
      } else if (top) {
        line.Append("▀");
      } else if (bottom) {
        line.Append("▄");
      } else {
        line.PushBack(' ');
      }
    }
    line.Append(quiet);
    out << "│ " << left << line.view() << right << " │\n";
  }
  for (std::size_t i = 0; i < kVerticalPaddingLines; ++i) {
    out << "│ " << left << empty_line << right << " │\n";
  }
  out << BoxBottom(inner) << "\n";
}

void PrintQrCode(std::ostream& out, std::string_view text) {
  if (!QrSupported()) {
    crypto::ThrowMnemonicError(crypto::ErrorKind::kQrUnavailable,
                               "QR output requires libqrencode, which this build lacks");
  }
  QrMatrix matrix;
  std::string error;
  if (!EncodeQr(text, &matrix, &error)) {
    util::LogWarn("QR encoding failed: " + error);
    PrintErrorBox(out, "failed to generate QR code: " + error +
                           ". the mnemonic may be too long.");
    return;
  }
  PrintQrMatrix(out, matrix);
}

}  // namespace s33d::cli
