#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads reporter configuration (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/ReporterConfig.hpp"

namespace crashwatch::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and maps it onto ReporterConfig.
 *
 *  * No caching: every call to `load()` re-reads the file.
 *  * Missing keys keep their defaults; wrong types or out-of-range values throw.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    /// `load()` followed by `parseReporterConfig()`.
    ReporterConfig loadReporterConfig() const;

  private:
    std::string path_;
  };

  /// Map a parsed document onto ReporterConfig or throw `std::runtime_error`.
  ReporterConfig parseReporterConfig(const nlohmann::json& doc);

} // namespace crashwatch::core
