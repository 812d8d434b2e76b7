/* @file ConfigLoader.cpp
 * @brief JSON → ReporterConfig with defaults and range checks.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>
#include <type_traits>

// Third-party headers
#include <nlohmann/json.hpp>

// CrashWatch headers
#include "core/ConfigLoader.hpp"

namespace crashwatch::core {

  namespace {

    template <typename T>
    void read(const nlohmann::json& doc, const char* key, T& out) {
      auto it = doc.find(key);
      if (it == doc.end() || it->is_null())
        return;
      if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
        if (it->is_number_integer() && it->template get<long long>() < 0)
          throw std::runtime_error(std::string("[ConfigLoader] '") + key +
                                   "' must not be negative");
      }
      try {
        out = it->template get<T>();
      } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("[ConfigLoader] bad value for '") + key +
                                 "': " + e.what());
      }
    }

    template <typename T>
    void requirePositive(const char* key, T value) {
      if (value <= 0)
        throw std::runtime_error(std::string("[ConfigLoader] '") + key + "' must be positive");
    }

  } // namespace

  ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

  nlohmann::json ConfigLoader::load() const {
    std::ifstream in(path_);
    if (!in)
      throw std::runtime_error("[ConfigLoader] cannot open config file: " + path_);

    try {
      return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
      throw std::runtime_error("[ConfigLoader] parse error in " + path_ + ": " + e.what());
    }
  }

  ReporterConfig ConfigLoader::loadReporterConfig() const { return parseReporterConfig(load()); }

  ReporterConfig parseReporterConfig(const nlohmann::json& doc) {
    if (!doc.is_object())
      throw std::runtime_error("[ConfigLoader] config root must be a JSON object");

    ReporterConfig cfg;
    read(doc, "max_tracked_entries", cfg.max_tracked_entries);
    read(doc, "track_duration_seconds", cfg.track_duration_seconds);
    read(doc, "version_tag", cfg.version_tag);
    read(doc, "rate_window_seconds", cfg.rate_window_seconds);
    read(doc, "max_reports_per_window", cfg.max_reports_per_window);
    read(doc, "rate_limiting_enabled", cfg.rate_limiting_enabled);
    read(doc, "site_id", cfg.site_id);
    read(doc, "include_log_tail", cfg.include_log_tail);
    read(doc, "log_path", cfg.log_path);
    read(doc, "log_tail_lines", cfg.log_tail_lines);
    read(doc, "log_chunk_bytes", cfg.log_chunk_bytes);
    read(doc, "log_max_bytes", cfg.log_max_bytes);
    read(doc, "required_fields", cfg.required_fields);
    read(doc, "source_root", cfg.source_root);
    read(doc, "plugin_version", cfg.plugin_version);
    read(doc, "host_version", cfg.host_version);
    read(doc, "integrations", cfg.integrations);
    read(doc, "diagnostics_log_path", cfg.diagnostics_log_path);
    read(doc, "spool_dir", cfg.spool_dir);

    requirePositive("max_tracked_entries", cfg.max_tracked_entries);
    requirePositive("track_duration_seconds", cfg.track_duration_seconds);
    requirePositive("rate_window_seconds", cfg.rate_window_seconds);
    requirePositive("max_reports_per_window", cfg.max_reports_per_window);
    requirePositive("log_chunk_bytes", cfg.log_chunk_bytes);
    requirePositive("log_max_bytes", cfg.log_max_bytes);
    return cfg;
  }

} // namespace crashwatch::core
