/* @file Severity.cpp
 * @brief severity classification (pure).
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <charconv>

// CrashWatch headers
#include "core/Severity.hpp"

namespace crashwatch::core {

  namespace {
    bool parseNumericCode(const std::string& code, long& out) {
      if (code.empty())
        return false;
      const char* first = code.data();
      const char* last = code.data() + code.size();
      auto [ptr, ec] = std::from_chars(first, last, out);
      return ec == std::errc{} && ptr == last;
    }
  } // namespace

  Severity classifySeverity(const std::string& code, const std::string& message) {
    long numeric = 0;
    if (parseNumericCode(code, numeric)) {
      if (numeric >= 500)
        return Severity::High;
      if (numeric >= 400)
        return Severity::Medium;
    }

    std::string lowered(message);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered.find("fatal") != std::string::npos || lowered.find("critical") != std::string::npos)
      return Severity::High;
    if (lowered.find("warning") != std::string::npos)
      return Severity::Medium;
    if (lowered.find("notice") != std::string::npos)
      return Severity::Low;
    return Severity::Medium;
  }

} // namespace crashwatch::core
