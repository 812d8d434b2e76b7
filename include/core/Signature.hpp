#pragma once
/** @file  Signature.hpp
 *  @brief Deterministic short fingerprints (CRC-32, hex) for dedup keys and reference ids.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include "protocols/ErrorReport.hpp"

namespace crashwatch::core {

  /// 8 lower-case hex chars of the zlib CRC-32 of \p data.
  std::string crc32Hex(std::string_view data);

  /**
   * @brief Identity fingerprint of a report: `message|file|line|code[|versionTag]`.
   *
   * Pure: identical identity fields always give the same signature. A non-empty
   * \p versionTag re-keys every signature so a bug fixed in a release is not
   * suppressed forever.
   */
  std::string computeSignature(const protocols::ErrorReport& report,
                               const std::string& versionTag = {});

  /// Short id quoted in the delivered report: hash of site+file+line+timestamp.
  std::string computeReferenceId(const std::string& siteId, const std::string& file, int line,
                                 std::int64_t timestamp);

} // namespace crashwatch::core
