#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace s33d::util {

// Overwrite memory with zeros through a path the optimizer cannot elide.
void SecureWipe(void* data, std::size_t size) noexcept;

inline void SecureWipe(std::span<std::uint8_t> data) noexcept {
  SecureWipe(data.data(), data.size());
}

template <typename Alloc>
inline void SecureWipe(std::vector<std::uint8_t, Alloc>& data) noexcept {
  SecureWipe(data.data(), data.size());
  data.clear();
}

// Wipes the whole capacity, not just size(), so bytes left behind by an
// earlier, longer value (or the small-string buffer) are cleared too.
template <typename Alloc>
inline void SecureWipe(std::basic_string<char, std::char_traits<char>, Alloc>& data) noexcept {
  data.resize(data.capacity());
  SecureWipe(data.data(), data.size());
  data.clear();
}

template <typename T, std::size_t N>
inline void SecureWipe(std::array<T, N>& data) noexcept {
  SecureWipe(data.data(), data.size() * sizeof(T));
}

}  // namespace s33d::util
