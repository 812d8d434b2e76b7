#pragma once
/** @file  Sanitize.hpp
 *  @brief Text scrubbing applied to report fields before they reach the sink.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <map>
#include <string>
#include <string_view>

namespace crashwatch::core {

  /**
   * Control characters become spaces, whitespace runs collapse to one space,
   * and the result is trimmed. With \p keepNewlines, '\n' survives so
   * multi-line text (stack traces) keeps its shape; '\r' is still removed.
   */
  std::string sanitizeText(std::string_view text, bool keepNewlines = false);

  /// sanitizeText() over every value; keys are scrubbed too and empty keys dropped.
  std::map<std::string, std::string> sanitizeFields(const std::map<std::string, std::string>& fields);

} // namespace crashwatch::core
