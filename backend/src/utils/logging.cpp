#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace overlapseg {
namespace utils {

bool Logger::initialized_ = false;
LogLevel Logger::level_ = LogLevel::INFO;
std::mutex Logger::mutex_;

void Logger::initialize(LogLevel level) {
  setLevel(level);
  if (!initialized_) {
    initialized_ = true;
    debug("Logger initialized");
  }
}

void Logger::info(const std::string &message) {
  write(LogLevel::INFO, "[INFO] ", message);
}

void Logger::warn(const std::string &message) {
  write(LogLevel::WARN, "[WARN] ", message);
}

void Logger::error(const std::string &message) {
  write(LogLevel::ERROR, "[ERROR] ", message);
}

void Logger::debug(const std::string &message) {
  write(LogLevel::DEBUG, "[DEBUG] ", message);
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

LogLevel Logger::getLevel() {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

bool Logger::parseLevel(const std::string &name, LogLevel &level) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  if (upper == "DEBUG") {
    level = LogLevel::DEBUG;
  } else if (upper == "INFO") {
    level = LogLevel::INFO;
  } else if (upper == "WARN" || upper == "WARNING") {
    level = LogLevel::WARN;
  } else if (upper == "ERROR") {
    level = LogLevel::ERROR;
  } else {
    return false;
  }
  return true;
}

void Logger::write(LogLevel level, const char *tag, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (static_cast<int>(level) < static_cast<int>(level_)) {
    return;
  }
  // Warnings and errors go to stderr
  std::ostream &out = level >= LogLevel::WARN ? std::cerr : std::cout;
  out << tag << message << std::endl;
}

} // namespace utils
} // namespace overlapseg
