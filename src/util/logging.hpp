#pragma once

#include <fstream>
#include <string>
#include <string_view>

namespace s33d::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);

// Accepts debug, info, warn/warning and error (any case). Throws
// std::runtime_error for anything else.
LogLevel ParseLogLevel(std::string_view value);

// File-backed diagnostic log. Disabled until Enable() succeeds; messages
// below the configured threshold are dropped. Callers must never pass
// secret material (entropy, phrase words, passphrase, seed).
class DebugLogger {
 public:
  void Enable(const std::string& path);
  void Disable();
  void SetLevel(LogLevel level) { level_threshold_ = level; }
  LogLevel Level() const { return level_threshold_; }
  bool Enabled() const { return stream_.is_open(); }

  void Log(LogLevel level, std::string_view message);

 private:
  std::ofstream stream_;
  std::string path_;
  LogLevel level_threshold_{LogLevel::kInfo};
};

DebugLogger& GlobalLogger();

void LogDebug(std::string_view message);
void LogInfo(std::string_view message);
void LogWarn(std::string_view message);
void LogError(std::string_view message);

}  // namespace s33d::util
