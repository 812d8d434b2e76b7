/* @file FileLogger.cpp
 * @brief Buffered append-only writer (fopen/fwrite/fflush).
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// CrashWatch headers
#include "io/FileLogger.hpp"

using namespace crashwatch::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "ab");
  if (fp_ == nullptr) {
    std::cerr << "Error " << errno << " from fopen(" << path << "): " << strerror(errno) << "\n";
    return false;
  }
  buffer_.reserve(kFlushThreshold);
  return true;
}

void FileLogger::write(const std::string& line) {
  if (fp_ == nullptr)
    return;

  buffer_.insert(buffer_.end(), line.begin(), line.end());
  if (buffer_.size() >= kFlushThreshold) {
    flush();
  }
}

bool FileLogger::flush() {
  if (fp_ == nullptr)
    return false;

  if (!buffer_.empty()) {
    std::size_t written = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_);
    if (written != buffer_.size()) {
      std::cerr << "Error " << errno << " from fwrite: " << strerror(errno) << "\n";
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(written));
      return false;
    }
    buffer_.clear();
  }
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (fp_ == nullptr)
    return;
  flush();
  std::fclose(fp_);
  fp_ = nullptr;
  buffer_.clear();
}
