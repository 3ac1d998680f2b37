#include "util/csprng.hpp"

#include <cstring>
#include <filesystem>

#ifdef _WIN32
#include <windows.h>
#include <bcrypt.h>
#else
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/random.h>
#endif
#endif

namespace s33d::util {

std::string_view RandomSourceName(RandomSource source) {
  switch (source) {
    case RandomSource::kGetrandom:
      return "getrandom";
    case RandomSource::kDevUrandom:
      return "/dev/urandom";
    case RandomSource::kBCrypt:
      return "BCryptGenRandom";
  }
  return "unknown";
}

bool FillSecureRandomBytes(std::span<std::uint8_t> out, RandomSource* used, std::string* error) {
  if (out.empty()) {
    return true;
  }

#ifdef _WIN32
  const NTSTATUS status =
      BCryptGenRandom(nullptr, out.data(), static_cast<ULONG>(out.size()),
                      BCRYPT_USE_SYSTEM_PREFERRED_RNG);
  if (status != 0) {
    if (error) {
      *error = "BCryptGenRandom failed";
    }
    return false;
  }
  if (used) {
    *used = RandomSource::kBCrypt;
  }
  return true;
#else
#if defined(__linux__)
  {
    std::size_t filled = 0;
    while (filled < out.size()) {
      const ssize_t n = getrandom(out.data() + filled, out.size() - filled, 0);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        break;
      }
      filled += static_cast<std::size_t>(n);
    }
    if (filled == out.size()) {
      if (used) {
        *used = RandomSource::kGetrandom;
      }
      return true;
    }
  }
#endif

  // Partial getrandom output is discarded; /dev/urandom refills the whole
  // buffer.
  const int fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    if (error) {
      *error = std::string("open(/dev/urandom) failed: ") + std::strerror(errno);
    }
    return false;
  }
  std::size_t filled = 0;
  while (filled < out.size()) {
    const ssize_t n = ::read(fd, out.data() + filled, out.size() - filled);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int saved = errno;
      ::close(fd);
      if (error) {
        *error = std::string("read(/dev/urandom) failed: ") + std::strerror(saved);
      }
      return false;
    }
    if (n == 0) {
      ::close(fd);
      if (error) {
        *error = "read(/dev/urandom) returned EOF";
      }
      return false;
    }
    filled += static_cast<std::size_t>(n);
  }
  ::close(fd);
  if (used) {
    *used = RandomSource::kDevUrandom;
  }
  return true;
#endif
}

std::vector<std::string> EntropySourceWarnings() {
  std::vector<std::string> warnings;
#ifndef _WIN32
  std::error_code ec;
  if (!std::filesystem::exists("/dev/urandom", ec)) {
    warnings.emplace_back(
        "system entropy source (/dev/urandom) not found, entropy quality may be compromised");
    return warnings;
  }
  if (!std::filesystem::exists("/dev/random", ec)) {
    warnings.emplace_back(
        "high quality entropy source (/dev/random) not available, using /dev/urandom");
  }
#endif
  return warnings;
}

}  // namespace s33d::util
