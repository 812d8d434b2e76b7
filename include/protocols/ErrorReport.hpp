#pragma once
/** @file  ErrorReport.hpp
 *  @brief One incident as handed in by the host application.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <map>
#include <string>

namespace crashwatch {
  namespace protocols {

    /**
 * @struct ErrorReport
 * @brief Identity fields plus free-form context of a single caught error.
 *
 *  * Created by the caller, enriched by the pipeline, never persisted.
 *  * `line == 0` means "unknown" and fails validation.
 *  * `timestamp == 0` is stamped with the reporter clock on receipt.
 */
    struct ErrorReport {
      std::string message;
      std::string code;
      std::string file;
      int line{ 0 };
      std::string stack_trace;
      std::int64_t timestamp{ 0 };
      std::map<std::string, std::string> extra;

      bool is_critical{ false };            ///< bypasses dedup and rate limit
      bool bypass_duplicate_check{ false }; ///< bypasses dedup only
    };

  } // namespace protocols
} // namespace crashwatch
