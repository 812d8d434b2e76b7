#pragma once
/** @file  ReportPayload.hpp
 *  @brief Enriched report handed to the delivery sink, with toWire.
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
 * @struct ReportPayload
 * @brief Everything the sink needs to render and transport one report.
 *
 *  * The sink owns templating and transport; it only sees this struct.
 *  * `toWire()` renders a pretty-printed JSON document.
 */
    struct ReportPayload {
      std::string error_message;
      std::string error_code;
      std::string relative_file_path;
      int error_line{ 0 };
      std::string severity;
      std::string reference_id;
      std::map<std::string, std::string> environment;
      std::string log_tail;

      std::string stack_trace;
      std::int64_t timestamp{ 0 };
      std::string site_id;
      std::string signature;
      std::map<std::string, std::string> extra;

      std::string toWire() const;
    };

  } // namespace protocols
} // namespace crashwatch
