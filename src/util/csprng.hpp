#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace s33d::util {

enum class RandomSource {
  kGetrandom,
  kDevUrandom,
  kBCrypt,
};

std::string_view RandomSourceName(RandomSource source);

// Fills `out` with bytes from the operating system CSPRNG. There is no
// userspace fallback: when every OS source fails the call returns false
// and `out` must not be used. `used` reports which source produced the
// bytes.
bool FillSecureRandomBytes(std::span<std::uint8_t> out, RandomSource* used = nullptr,
                           std::string* error = nullptr);

// Human-readable warnings about the host's entropy devices. Empty when
// both /dev/urandom and /dev/random are present (always empty on Windows).
std::vector<std::string> EntropySourceWarnings();

}  // namespace s33d::util
