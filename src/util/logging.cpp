#include "util/logging.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace s33d::util {

namespace {

std::string FormatTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t time = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
#ifdef _WIN32
  localtime_s(&tm_buf, &time);
#else
  localtime_r(&time, &tm_buf);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

}  // namespace

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

LogLevel ParseLogLevel(std::string_view value) {
  std::string lower;
  lower.reserve(value.size());
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "debug") {
    return LogLevel::kDebug;
  }
  if (lower == "info") {
    return LogLevel::kInfo;
  }
  if (lower == "warn" || lower == "warning") {
    return LogLevel::kWarn;
  }
  if (lower == "error") {
    return LogLevel::kError;
  }
  throw std::runtime_error("invalid log level: " + std::string(value));
}

void DebugLogger::Enable(const std::string& path) {
  if (stream_.is_open()) {
    stream_.close();
  }
  path_ = path;
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
  }
  stream_.open(path, std::ios::app);
  if (!stream_) {
    throw std::runtime_error("failed to open debug log: " + path);
  }
  stream_ << "---- s33d debug log started " << FormatTimestamp() << " ----\n";
  stream_.flush();
}

void DebugLogger::Disable() {
  if (stream_.is_open()) {
    stream_.close();
  }
  path_.clear();
}

void DebugLogger::Log(LogLevel level, std::string_view message) {
  if (!stream_.is_open()) {
    return;
  }
  if (static_cast<int>(level) < static_cast<int>(level_threshold_)) {
    return;
  }
  stream_ << "[" << FormatTimestamp() << "] [" << LogLevelName(level) << "] " << message
          << '\n';
  stream_.flush();
}

DebugLogger& GlobalLogger() {
  static DebugLogger logger;
  return logger;
}

void LogDebug(std::string_view message) { GlobalLogger().Log(LogLevel::kDebug, message); }
void LogInfo(std::string_view message) { GlobalLogger().Log(LogLevel::kInfo, message); }
void LogWarn(std::string_view message) { GlobalLogger().Log(LogLevel::kWarn, message); }
void LogError(std::string_view message) { GlobalLogger().Log(LogLevel::kError, message); }

}  // namespace s33d::util
