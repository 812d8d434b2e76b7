#pragma once
/** @file  Severity.hpp
 *  @brief Coarse triage bucket derived from error code and message.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

namespace crashwatch {
  namespace core {

    enum class Severity { Low, Medium, High };

    inline const char* toString(Severity s) {
      switch (s) {
      case Severity::Low:
        return "low";
      case Severity::Medium:
        return "medium";
      case Severity::High:
        return "high";
      default:
        return "medium";
      }
    }

    /// Numeric code >=500 high, >=400 medium; then fatal/critical, warning, notice in the message.
    Severity classifySeverity(const std::string& code, const std::string& message);

  } // namespace core
} // namespace crashwatch
