#include "utils/logging.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace fastnet {
namespace utils {

namespace {

std::mutex& outputMutex() {
  static std::mutex m;
  return m;
}

std::atomic<bool> g_enabled{true};
std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};

std::string& tagStorage() {
  static std::string tag;
  return tag;
}

} // namespace

bool Logger::initialized_ = false;

void Logger::initialize() {
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

void Logger::enable() { g_enabled = true; }

void Logger::disable() { g_enabled = false; }

bool Logger::isEnabled() { return g_enabled; }

void Logger::setLevel(LogLevel level) { g_level = static_cast<int>(level); }

LogLevel Logger::getLevel() { return static_cast<LogLevel>(g_level.load()); }

void Logger::setTag(const std::string &tag) {
  std::lock_guard<std::mutex> lock(outputMutex());
  tagStorage() = tag;
}

std::string Logger::getTag() {
  std::lock_guard<std::mutex> lock(outputMutex());
  return tagStorage();
}

LogLevel Logger::parseLevel(const std::string &name, LogLevel fallback) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (upper == "DEBUG") return LogLevel::DEBUG;
  if (upper == "INFO") return LogLevel::INFO;
  if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
  if (upper == "ERROR") return LogLevel::ERROR;
  return fallback;
}

std::string Logger::levelName(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARN: return "WARN";
    case LogLevel::ERROR: return "ERROR";
  }
  return "INFO";
}

void Logger::write(LogLevel level, const std::string &message) {
  if (!g_enabled || static_cast<int>(level) < g_level.load()) {
    return;
  }

  std::lock_guard<std::mutex> lock(outputMutex());
  std::ostream &out = (level == LogLevel::ERROR) ? std::cerr : std::cout;
  out << "[" << levelName(level) << "] ";
  if (!tagStorage().empty()) {
    out << "[" << tagStorage() << "] ";
  }
  out << message << std::endl;
}

} // namespace utils
} // namespace fastnet
