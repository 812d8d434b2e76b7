#pragma once
/** @file  LogTailReader.hpp
 *  @brief Last-N-lines reader for log files of unknown size (backward chunked pread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <string>
#include <vector>

namespace crashwatch {
  namespace io {

    struct LogTailResult {
      std::vector<std::string> lines; ///< oldest first, never a trailing empty artifact
      std::size_t readCalls{ 0 };     ///< pread() calls issued
      std::size_t bytesRead{ 0 };
      std::string error; ///< non-empty when the file could not be read

      /// Lines joined with '\n' (no trailing newline).
      std::string joined() const;
    };

    /**
 * @class LogTailReader
 * @brief Reads backwards from EOF one chunk at a time until N complete lines are buffered.
 *
 *  * Reads never go further back than `maxBytes` from EOF; older content is ignored.
 *  * A line cut by the byte ceiling is dropped, not returned partially.
 *  * Missing/unreadable files give an empty result with `error` set; never throws.
 *  * Content is opaque: no encoding checks, `\r` is kept.
 */
    class LogTailReader {
    public:
      static constexpr std::size_t kDefaultChunkBytes = 4096;
      static constexpr std::size_t kDefaultMaxBytes = 5 * 1024 * 1024;

      explicit LogTailReader(std::size_t chunkBytes = kDefaultChunkBytes,
                             std::size_t maxBytes = kDefaultMaxBytes);

      LogTailResult tail(const std::string& path, std::size_t lineCount) const;

      std::size_t chunkBytes() const { return chunkBytes_; }
      std::size_t maxBytes() const { return maxBytes_; }

    private:
      std::size_t chunkBytes_;
      std::size_t maxBytes_;
    };

  } // namespace io
} // namespace crashwatch
