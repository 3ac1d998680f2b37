#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "util/secure_buffer.hpp"

namespace s33d::util {

// Strict UTF-8 check: rejects overlong forms, encoded surrogates and
// truncated sequences.
bool IsValidUtf8(std::string_view text);

// Unicode NFKD normalization (ICU). Fails on malformed UTF-8 input; the
// intermediate UTF-16 buffers are wiped before returning.
bool NormalizeNfkd(std::string_view text, SecureString* out, std::string* error = nullptr);

// Terminal column count of a UTF-8 string: East Asian wide and fullwidth
// characters take two columns, combining marks, Hangul medial and final
// jamo and format characters take none.
std::size_t DisplayWidth(std::string_view text);

}  // namespace s33d::util
