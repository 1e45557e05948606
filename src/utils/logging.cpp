#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace loadpulse {
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
  write(LogLevel::INFO, message);
}

void Logger::warn(const std::string &message) {
  write(LogLevel::WARN, message);
}

void Logger::error(const std::string &message) {
  write(LogLevel::ERROR, message);
}

void Logger::debug(const std::string &message) {
  write(LogLevel::DEBUG, message);
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

std::string Logger::levelName(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  }
  return "INFO";
}

void Logger::write(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (level < level_) {
    return;
  }

  // Worker threads log concurrently; the lock keeps lines whole
  if (level == LogLevel::ERROR) {
    std::cerr << "[ERROR] " << message << std::endl;
  } else {
    std::cout << "[" << levelName(level) << "] " << message << std::endl;
  }
}

} // namespace utils
} // namespace loadpulse
