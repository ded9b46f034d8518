#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

enum class LogLevel { DEBUG, INFO, WARN, ERROR };

// Parses "debug", "info", "warn"/"warning", "error" (any case).
// Unknown names map to INFO.
inline LogLevel logLevelFromString(std::string name) {
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (name == "debug")
    return LogLevel::DEBUG;
  if (name == "warn" || name == "warning")
    return LogLevel::WARN;
  if (name == "error")
    return LogLevel::ERROR;
  return LogLevel::INFO;
}

class Logger {
public:
  static void setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_level_ = level;
  }

  // Send every console line to stderr. Used by the CLI so stdout only
  // carries the rendered result.
  static void setConsoleToStderr(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_to_stderr_ = enabled;
  }

  static void setLogFile(const std::string &path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
      log_file_.close();
    }
    if (path.empty())
      return;
    log_file_.open(path, std::ios::app);
    if (!log_file_.is_open()) {
      std::cerr << "[Logger] Failed to open log file: " << path << std::endl;
    }
  }

  static void log(LogLevel level, const std::string &msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < current_level_) {
      return;
    }

    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&in_time_t, &local_tm);
    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");

    std::string levelStr;
    switch (level) {
    case LogLevel::DEBUG:
      levelStr = "[DEBUG]";
      break;
    case LogLevel::INFO:
      levelStr = "[INFO ]";
      break;
    case LogLevel::WARN:
      levelStr = "[WARN ]";
      break;
    case LogLevel::ERROR:
      levelStr = "[ERROR]";
      break;
    }

    std::string fullMsg = ss.str() + " " + levelStr + " " + msg;

    if (console_to_stderr_ || level >= LogLevel::ERROR) {
      std::cerr << fullMsg << std::endl;
    } else {
      std::cout << fullMsg << std::endl;
    }

    if (log_file_.is_open()) {
      log_file_ << fullMsg << std::endl;
    }
  }

private:
  static inline std::mutex mutex_;
  static inline LogLevel current_level_ = LogLevel::INFO;
  static inline bool console_to_stderr_ = false;
  static inline std::ofstream log_file_;
};
