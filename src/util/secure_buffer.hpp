#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "util/secure_wipe.hpp"

namespace s33d::util {

// Owning byte buffer that is wiped when it is destroyed, reassigned or
// moved from. Used for entropy and any other raw secret bytes.
//
// The allocator parameter only exists so tests can observe the storage at
// the moment it is handed back; production code uses SecureBytes.
template <typename Alloc = std::allocator<std::uint8_t>>
class BasicSecureBytes {
 public:
  BasicSecureBytes() = default;
  explicit BasicSecureBytes(std::size_t size, const Alloc& alloc = Alloc())
      : data_(size, 0, alloc) {}
  explicit BasicSecureBytes(std::span<const std::uint8_t> bytes, const Alloc& alloc = Alloc())
      : data_(bytes.begin(), bytes.end(), alloc) {}

  BasicSecureBytes(const BasicSecureBytes&) = delete;
  BasicSecureBytes& operator=(const BasicSecureBytes&) = delete;

  BasicSecureBytes(BasicSecureBytes&& other) noexcept : data_(std::move(other.data_)) {
    other.data_.clear();
  }
  BasicSecureBytes& operator=(BasicSecureBytes&& other) noexcept {
    if (this != &other) {
      Wipe();
      data_ = std::move(other.data_);
      other.data_.clear();
    }
    return *this;
  }

  ~BasicSecureBytes() { Wipe(); }

  void Wipe() noexcept { SecureWipe(data_.data(), data_.size()); }

  std::uint8_t* data() noexcept { return data_.data(); }
  const std::uint8_t* data() const noexcept { return data_.data(); }
  std::size_t size() const noexcept { return data_.size(); }
  bool empty() const noexcept { return data_.empty(); }

  std::uint8_t& operator[](std::size_t i) { return data_[i]; }
  std::uint8_t operator[](std::size_t i) const { return data_[i]; }

  std::span<std::uint8_t> span() noexcept { return {data_.data(), data_.size()}; }
  std::span<const std::uint8_t> span() const noexcept { return {data_.data(), data_.size()}; }

 private:
  std::vector<std::uint8_t, Alloc> data_;
};

using SecureBytes = BasicSecureBytes<>;

// Owning UTF-8 string for passphrases and rendered phrases. Growth never
// leaves an unwiped copy behind: the old buffer is cleared before it is
// released.
template <typename Alloc = std::allocator<char>>
class BasicSecureString {
 public:
  using string_type = std::basic_string<char, std::char_traits<char>, Alloc>;

  BasicSecureString() = default;
  explicit BasicSecureString(const Alloc& alloc) : value_(alloc) {}
  explicit BasicSecureString(std::string_view text, const Alloc& alloc = Alloc())
      : value_(alloc) {
    Append(text);
  }

  BasicSecureString(const BasicSecureString&) = delete;
  BasicSecureString& operator=(const BasicSecureString&) = delete;

  BasicSecureString(BasicSecureString&& other) noexcept : value_(std::move(other.value_)) {
    SecureWipe(other.value_);
  }
  BasicSecureString& operator=(BasicSecureString&& other) noexcept {
    if (this != &other) {
      SecureWipe(value_);
      value_ = std::move(other.value_);
      SecureWipe(other.value_);
    }
    return *this;
  }

  ~BasicSecureString() { SecureWipe(value_); }

  // Takes the contents of a plain std::string and wipes the source.
  static BasicSecureString Adopt(std::string& source) {
    BasicSecureString out{std::string_view(source)};
    SecureWipe(source);
    return out;
  }

  void Reserve(std::size_t capacity) {
    if (capacity <= value_.capacity()) {
      return;
    }
    string_type grown(value_.get_allocator());
    grown.reserve(std::max(capacity, value_.capacity() * 2));
    grown.append(value_);
    SecureWipe(value_);
    value_.swap(grown);
  }

  void Append(std::string_view text) {
    Reserve(value_.size() + text.size());
    value_.append(text.data(), text.size());
  }

  void PushBack(char ch) {
    Reserve(value_.size() + 1);
    value_.push_back(ch);
  }

  void Clear() noexcept { SecureWipe(value_); }

  std::string_view view() const noexcept { return {value_.data(), value_.size()}; }
  const char* c_str() const noexcept { return value_.c_str(); }
  std::size_t size() const noexcept { return value_.size(); }
  bool empty() const noexcept { return value_.empty(); }

 private:
  string_type value_;
};

using SecureString = BasicSecureString<>;

// Fixed-size secret (the 64-byte BIP39 seed). Moving copies the bytes and
// wipes the source.
template <std::size_t N>
class SecureArray {
 public:
  SecureArray() = default;

  SecureArray(const SecureArray&) = delete;
  SecureArray& operator=(const SecureArray&) = delete;

  SecureArray(SecureArray&& other) noexcept : bytes_(other.bytes_) { SecureWipe(other.bytes_); }
  SecureArray& operator=(SecureArray&& other) noexcept {
    if (this != &other) {
      bytes_ = other.bytes_;
      SecureWipe(other.bytes_);
    }
    return *this;
  }

  ~SecureArray() { SecureWipe(bytes_); }

  std::uint8_t* data() noexcept { return bytes_.data(); }
  const std::uint8_t* data() const noexcept { return bytes_.data(); }
  static constexpr std::size_t size() noexcept { return N; }

  std::span<std::uint8_t, N> span() noexcept { return std::span<std::uint8_t, N>(bytes_); }
  std::span<const std::uint8_t, N> span() const noexcept {
    return std::span<const std::uint8_t, N>(bytes_);
  }

 private:
  std::array<std::uint8_t, N> bytes_{};
};

// Length-aware comparison that does not exit early on the first differing
// byte.
inline bool ConstantTimeEqual(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  unsigned char diff = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    diff = static_cast<unsigned char>(diff | (static_cast<unsigned char>(a[i]) ^
                                              static_cast<unsigned char>(b[i])));
  }
  return diff == 0;
}

}  // namespace s33d::util
