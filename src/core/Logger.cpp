/* @file Logger.cpp
 * @brief CSV diagnostics logger (file or stderr).
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>

// CrashWatch headers
#include "core/Logger.hpp"

using namespace crashwatch::core;

const char* crashwatch::core::toString(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARNING";
  case LogLevel::Error:
    return "ERROR";
  default:
    return "UNKNOWN";
  }
}

Logger::Logger(std::shared_ptr<Clock> clock) : clock_(std::move(clock)) {
  if (!clock_)
    clock_ = std::make_shared<SystemClock>();
}

Logger::~Logger() { close(); }

bool Logger::open(const std::string& path) {
  std::lock_guard<std::mutex> lock(mtx_);
  return file_.open(path);
}

void Logger::close() {
  std::lock_guard<std::mutex> lock(mtx_);
  file_.close();
}

void Logger::setMinLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mtx_);
  minLevel_ = level;
}

std::string Logger::formatRow(std::int64_t unixTime, const LogEvent& event) {
  // quote the message, doubling embedded quotes; newlines flattened to keep one row per event
  std::string quoted;
  quoted.reserve(event.message.size() + 2);
  quoted += '"';
  for (char c : event.message) {
    if (c == '"')
      quoted += "\"\"";
    else if (c == '\n' || c == '\r')
      quoted += ' ';
    else
      quoted += c;
  }
  quoted += '"';

  return std::to_string(unixTime) + "," + toString(event.level) + "," + event.component + "," +
         quoted;
}

void Logger::log(const LogEvent& event) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (event.level < minLevel_)
    return;

  const std::string row = formatRow(clock_->now(), event);
  if (!file_.isOpen()) {
    std::cerr << row << '\n';
    return;
  }

  file_.write(row + "\n");
  if (event.level >= LogLevel::Warning)
    file_.flush();
}

void Logger::debug(const std::string& component, const std::string& message) {
  log({ LogLevel::Debug, component, message });
}

void Logger::info(const std::string& component, const std::string& message) {
  log({ LogLevel::Info, component, message });
}

void Logger::warn(const std::string& component, const std::string& message) {
  log({ LogLevel::Warning, component, message });
}

void Logger::error(const std::string& component, const std::string& message) {
  log({ LogLevel::Error, component, message });
}
