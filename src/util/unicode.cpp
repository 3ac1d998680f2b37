#include "util/unicode.hpp"

#include <cstdint>
#include <limits>
#include <vector>

#include <unicode/uchar.h>
#include <unicode/unorm2.h>
#include <unicode/ustring.h>
#include <unicode/utf8.h>

namespace s33d::util {

namespace {

bool FitsInt32(std::size_t size) {
  return size <= static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max());
}

// Preflight calls report the required length through U_BUFFER_OVERFLOW_ERROR
// (or a warning for empty output); anything else is a real failure.
bool PreflightOk(UErrorCode* status) {
  if (*status == U_BUFFER_OVERFLOW_ERROR || U_SUCCESS(*status)) {
    *status = U_ZERO_ERROR;
    return true;
  }
  return false;
}

void WipeUtf16(std::vector<UChar>& buffer) {
  SecureWipe(buffer.data(), buffer.size() * sizeof(UChar));
  buffer.clear();
}

void SetError(std::string* error, const char* message, UErrorCode status) {
  if (error) {
    *error = std::string(message) + ": " + u_errorName(status);
  }
}

}  // namespace

bool IsValidUtf8(std::string_view text) {
  if (!FitsInt32(text.size())) {
    return false;
  }
  const auto* bytes = reinterpret_cast<const std::uint8_t*>(text.data());
  const std::int32_t length = static_cast<std::int32_t>(text.size());
  std::int32_t i = 0;
  while (i < length) {
    UChar32 c = 0;
    U8_NEXT(bytes, i, length, c);
    if (c < 0) {
      return false;
    }
  }
  return true;
}

bool NormalizeNfkd(std::string_view text, SecureString* out, std::string* error) {
  out->Clear();
  if (!IsValidUtf8(text)) {
    if (error) {
      *error = "input is not valid UTF-8";
    }
    return false;
  }
  if (text.empty()) {
    return true;
  }

  UErrorCode status = U_ZERO_ERROR;
  const UNormalizer2* nfkd = unorm2_getNFKDInstance(&status);
  if (U_FAILURE(status)) {
    SetError(error, "NFKD normalizer unavailable", status);
    return false;
  }

  const std::int32_t src_len = static_cast<std::int32_t>(text.size());
  std::int32_t utf16_len = 0;
  u_strFromUTF8(nullptr, 0, &utf16_len, text.data(), src_len, &status);
  if (!PreflightOk(&status)) {
    SetError(error, "UTF-8 decoding failed", status);
    return false;
  }
  std::vector<UChar> utf16(static_cast<std::size_t>(utf16_len) + 1);
  u_strFromUTF8(utf16.data(), static_cast<std::int32_t>(utf16.size()), &utf16_len, text.data(),
                src_len, &status);
  if (U_FAILURE(status)) {
    WipeUtf16(utf16);
    SetError(error, "UTF-8 decoding failed", status);
    return false;
  }

  std::int32_t normalized_len =
      unorm2_normalize(nfkd, utf16.data(), utf16_len, nullptr, 0, &status);
  if (!PreflightOk(&status)) {
    WipeUtf16(utf16);
    SetError(error, "NFKD normalization failed", status);
    return false;
  }
  std::vector<UChar> normalized(static_cast<std::size_t>(normalized_len) + 1);
  normalized_len = unorm2_normalize(nfkd, utf16.data(), utf16_len, normalized.data(),
                                    static_cast<std::int32_t>(normalized.size()), &status);
  WipeUtf16(utf16);
  if (U_FAILURE(status)) {
    WipeUtf16(normalized);
    SetError(error, "NFKD normalization failed", status);
    return false;
  }

  std::int32_t utf8_len = 0;
  u_strToUTF8(nullptr, 0, &utf8_len, normalized.data(), normalized_len, &status);
  if (!PreflightOk(&status)) {
    WipeUtf16(normalized);
    SetError(error, "UTF-8 encoding failed", status);
    return false;
  }
  std::vector<char> utf8(static_cast<std::size_t>(utf8_len) + 1);
  u_strToUTF8(utf8.data(), static_cast<std::int32_t>(utf8.size()), &utf8_len, normalized.data(),
              normalized_len, &status);
  WipeUtf16(normalized);
  if (U_FAILURE(status)) {
    SecureWipe(utf8.data(), utf8.size());
    SetError(error, "UTF-8 encoding failed", status);
    return false;
  }
  out->Append(std::string_view(utf8.data(), static_cast<std::size_t>(utf8_len)));
  SecureWipe(utf8.data(), utf8.size());
  return true;
}

std::size_t DisplayWidth(std::string_view text) {
  const auto* bytes = reinterpret_cast<const std::uint8_t*>(text.data());
  const std::int32_t length =
      FitsInt32(text.size()) ? static_cast<std::int32_t>(text.size())
                             : std::numeric_limits<std::int32_t>::max();
  std::size_t width = 0;
  std::int32_t i = 0;
  while (i < length) {
    UChar32 c = 0;
    U8_NEXT(bytes, i, length, c);
    if (c < 0) {
      // Rendered as U+FFFD.
      width += 1;
      continue;
    }
    if (c == 0 || u_iscntrl(c)) {
      continue;
    }
    const std::int8_t category = u_charType(c);
    if (category == U_NON_SPACING_MARK || category == U_ENCLOSING_MARK ||
        category == U_FORMAT_CHAR) {
      continue;
    }
    if (c >= 0x1160 && c <= 0x11FF) {
      continue;
    }
    const std::int32_t east_asian = u_getIntPropertyValue(c, UCHAR_EAST_ASIAN_WIDTH);
    width += (east_asian == U_EA_WIDE || east_asian == U_EA_FULLWIDTH) ? 2 : 1;
  }
  return width;
}

}  // namespace s33d::util
