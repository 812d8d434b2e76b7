/* @file ReportPayload.cpp
 * @brief JSON rendering of the delivery payload.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// Third-party headers
#include <nlohmann/json.hpp>

// CrashWatch headers
#include "protocols/ReportPayload.hpp"

using namespace crashwatch::protocols;

std::string ReportPayload::toWire() const {
  nlohmann::json doc = {
    { "error_message", error_message },
    { "error_code", error_code },
    { "relative_file_path", relative_file_path },
    { "error_line", error_line },
    { "severity", severity },
    { "reference_id", reference_id },
    { "environment", environment },
    { "log_tail", log_tail },
    { "stack_trace", stack_trace },
    { "timestamp", timestamp },
    { "site_id", site_id },
    { "signature", signature },
    { "extra", extra },
  };
  // replace invalid UTF-8 (log tails are opaque bytes) instead of throwing
  return doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}
