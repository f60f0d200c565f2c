#pragma once

#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include "miniflow/errors.hpp"

namespace miniflow {

// ==========================================
// Logging
// ==========================================
enum class LogLevel { kDebug, kInfo, kWarn, kError };

using LogFn = std::function<void(LogLevel, const std::string&)>;

inline const char* LogLevelTag(LogLevel level) {
  static const char* tags[] = {"DEBUG", "INFO", "WARN", "ERROR"};
  return tags[static_cast<int>(level)];
}

inline LogFn StderrLogger(LogLevel min = LogLevel::kInfo) {
  return [min](LogLevel level, const std::string& msg) {
    if (level < min) return;
    std::cerr << "[" << LogLevelTag(level) << "] " << msg << "\n";
  };
}

// Appends to `path`. Lines from concurrent callers are never interleaved.
inline LogFn FileLogger(const std::string& path,
                        LogLevel min = LogLevel::kInfo) {
  auto out = std::make_shared<std::ofstream>(path, std::ios::app);
  if (!out->is_open()) {
    throw std::runtime_error("Cannot open log file: " + path);
  }
  auto mu = std::make_shared<std::mutex>();
  return [out, mu, min](LogLevel level, const std::string& msg) {
    if (level < min) return;
    std::lock_guard<std::mutex> lock(*mu);
    *out << "[" << LogLevelTag(level) << "] " << msg << std::endl;
  };
}

// Accepts level names and the numeric aliases 0 (error) .. 3 (debug).
inline LogLevel ParseLogLevel(std::string name) {
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (name == "debug" || name == "3") return LogLevel::kDebug;
  if (name == "info" || name == "2") return LogLevel::kInfo;
  if (name == "warn" || name == "warning" || name == "1") return LogLevel::kWarn;
  if (name == "error" || name == "0") return LogLevel::kError;
  throw ConfigError("Invalid log level: '" + name +
                    "' (allowed: debug, info, warn, error, 0-3)");
}

}  // namespace miniflow
