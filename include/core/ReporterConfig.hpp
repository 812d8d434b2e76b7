#pragma once
/** @file  ReporterConfig.hpp
 *  @brief Tunables recognised by the reporter, with their defaults.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace crashwatch::core {

  struct ReporterConfig {
    // duplicate filter
    std::size_t max_tracked_entries{ 1000 };
    std::int64_t track_duration_seconds{ 604800 }; ///< 7 days
    std::string version_tag;                      ///< appended to signatures when non-empty

    // rate limiter
    std::int64_t rate_window_seconds{ 600 };
    int max_reports_per_window{ 5 };
    bool rate_limiting_enabled{ true };
    std::string site_id{ "default" }; ///< tenant scope of the rate counter

    // log tail
    bool include_log_tail{ true };
    std::string log_path;
    std::size_t log_tail_lines{ 100 };
    std::size_t log_chunk_bytes{ 4096 };
    std::size_t log_max_bytes{ 5 * 1024 * 1024 };

    // validation / enrichment
    std::vector<std::string> required_fields{ "message", "code", "file", "line" };
    std::string source_root; ///< stripped from report file paths
    std::string plugin_version;
    std::string host_version;
    std::vector<std::string> integrations;

    // local plumbing
    std::string diagnostics_log_path;
    std::string spool_dir;
  };

} // namespace crashwatch::core
