/* @file Signature.cpp
 * @brief CRC-32 fingerprints via zlib.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstdio>

// Third-party headers
#include <zlib.h>

// CrashWatch headers
#include "core/Signature.hpp"

namespace crashwatch::core {

  namespace {
    constexpr char kSeparator = '|';
  }

  std::string crc32Hex(std::string_view data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    // zlib takes uInt lengths; feed oversized input in slices
    while (!data.empty()) {
      const auto len = static_cast<uInt>(std::min<std::size_t>(data.size(), 1u << 30));
      crc = crc32(crc, reinterpret_cast<const Bytef*>(data.data()), len);
      data.remove_prefix(len);
    }

    char hex[9];
    std::snprintf(hex, sizeof(hex), "%08lx", static_cast<unsigned long>(crc & 0xffffffffUL));
    return std::string(hex, 8);
  }

  std::string computeSignature(const protocols::ErrorReport& report,
                               const std::string& versionTag) {
    std::string joined;
    joined.reserve(report.message.size() + report.file.size() + report.code.size() + 32);
    joined += report.message;
    joined += kSeparator;
    joined += report.file;
    joined += kSeparator;
    joined += std::to_string(report.line);
    joined += kSeparator;
    joined += report.code;
    if (!versionTag.empty()) {
      joined += kSeparator;
      joined += versionTag;
    }
    return crc32Hex(joined);
  }

  std::string computeReferenceId(const std::string& siteId, const std::string& file, int line,
                                 std::int64_t timestamp) {
    return crc32Hex(siteId + kSeparator + file + kSeparator + std::to_string(line) + kSeparator +
                    std::to_string(timestamp));
  }

} // namespace crashwatch::core
