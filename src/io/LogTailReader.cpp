/* @file LogTailReader.cpp
 * @brief backward chunked tail read over a POSIX file descriptor.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cerrno>
#include <cstring> // for strerror

// Linux headers
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h> // pread(), close()

// CrashWatch headers
#include "io/LogTailReader.hpp"

using namespace crashwatch::io;

namespace {

  /// Closes the descriptor on every exit path.
  class ScopedFd {
  public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() {
      if (fd_ >= 0)
        ::close(fd_);
    }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }

  private:
    int fd_;
  };

  std::string errnoMessage(const char* what, const std::string& path) {
    return std::string(what) + "(" + path + "): " + strerror(errno);
  }

} // namespace

std::string LogTailResult::joined() const {
  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i != 0)
      out += '\n';
    out += lines[i];
  }
  return out;
}

LogTailReader::LogTailReader(std::size_t chunkBytes, std::size_t maxBytes)
    : chunkBytes_(std::max<std::size_t>(chunkBytes, 1)), maxBytes_(maxBytes) {}

LogTailResult LogTailReader::tail(const std::string& path, std::size_t lineCount) const {
  LogTailResult result;
  if (lineCount == 0)
    return result;

  ScopedFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (fd.get() < 0) {
    result.error = errnoMessage("open", path);
    return result;
  }

  struct stat st {};
  if (::fstat(fd.get(), &st) != 0) {
    result.error = errnoMessage("fstat", path);
    return result;
  }
  if (!S_ISREG(st.st_mode)) {
    result.error = "not a regular file: " + path;
    return result;
  }

  const auto size = static_cast<std::size_t>(st.st_size);
  if (size == 0 || maxBytes_ == 0)
    return result;

  const std::size_t floor = size > maxBytes_ ? size - maxBytes_ : 0;
  std::size_t cursor = size;

  // chunks are collected newest first and stitched once at the end
  std::vector<std::string> chunks;
  std::size_t newlines = 0;
  bool endsWithNewline = false;

  while (cursor > floor) {
    const std::size_t readSize = std::min(chunkBytes_, cursor - floor);
    std::string chunk(readSize, '\0');

    std::size_t got = 0;
    while (got < readSize) {
      ssize_t n = ::pread(fd.get(), chunk.data() + got, readSize - got,
                          static_cast<off_t>(cursor - readSize + got));
      ++result.readCalls;
      if (n > 0) {
        got += static_cast<std::size_t>(n);
      } else if (n == -1 && errno == EINTR) {
        continue; // interrupted → retry
      } else {
        break; // EOF (file shrank) or I/O error
      }
    }
    if (got < readSize) {
      result.error = errnoMessage("pread", path);
      result.lines.clear();
      return result;
    }

    cursor -= readSize;
    result.bytesRead += readSize;
    if (chunks.empty())
      endsWithNewline = chunk.back() == '\n';
    newlines += static_cast<std::size_t>(std::count(chunk.begin(), chunk.end(), '\n'));
    chunks.push_back(std::move(chunk));

    // the first segment may be partial and a final '\n' adds no line
    const std::size_t complete = newlines - (endsWithNewline ? 1 : 0);
    if (complete >= lineCount)
      break;
  }

  std::string buffer;
  buffer.reserve(result.bytesRead);
  for (auto it = chunks.rbegin(); it != chunks.rend(); ++it)
    buffer += *it;
  chunks.clear();

  std::vector<std::string> lines;
  std::size_t start = 0;
  while (true) {
    const std::size_t pos = buffer.find('\n', start);
    if (pos == std::string::npos) {
      lines.emplace_back(buffer, start);
      break;
    }
    lines.emplace_back(buffer, start, pos - start);
    start = pos + 1;
  }

  if (endsWithNewline && !lines.empty() && lines.back().empty())
    lines.pop_back();

  // a line that started before the cursor was cut in half
  if (cursor > 0 && !lines.empty())
    lines.erase(lines.begin());

  if (lines.size() > lineCount)
    lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(lineCount));

  result.lines = std::move(lines);
  return result;
}
