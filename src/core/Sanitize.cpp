/* @file Sanitize.cpp
 * @brief control-character scrubbing for report text.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// CrashWatch headers
#include "core/Sanitize.hpp"

namespace crashwatch::core {

  namespace {

    bool isControl(unsigned char c) { return c < 0x20 || c == 0x7f; }

    void trimTrailingBlank(std::string& s) {
      while (!s.empty() && s.back() == ' ')
        s.pop_back();
    }

  } // namespace

  std::string sanitizeText(std::string_view text, bool keepNewlines) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;

    for (char ch : text) {
      const auto c = static_cast<unsigned char>(ch);

      if (keepNewlines && c == '\n') {
        trimTrailingBlank(out);
        out += '\n';
        pendingSpace = false;
        continue;
      }
      if (c == ' ' || isControl(c)) {
        pendingSpace = true;
        continue;
      }

      if (pendingSpace && !out.empty() && out.back() != '\n')
        out += ' ';
      pendingSpace = false;
      out += ch;
    }

    trimTrailingBlank(out);
    while (!out.empty() && out.back() == '\n')
      out.pop_back();
    return out;
  }

  std::map<std::string, std::string> sanitizeFields(const std::map<std::string, std::string>& fields) {
    std::map<std::string, std::string> out;
    for (const auto& [key, value] : fields) {
      std::string cleanKey = sanitizeText(key);
      if (cleanKey.empty())
        continue;
      out[std::move(cleanKey)] = sanitizeText(value);
    }
    return out;
  }

} // namespace crashwatch::core
