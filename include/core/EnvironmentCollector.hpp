#pragma once
/** @file  EnvironmentCollector.hpp
 *  @brief Point-in-time context map built from independent probes.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/ErrorMonitor.hpp"
#include "core/ReporterConfig.hpp"

namespace crashwatch::core {

  using EnvironmentSnapshot = std::map<std::string, std::string>;

  /// One fact about the running system. `gather` may throw.
  struct EnvironmentProbe {
    std::string key;
    std::function<std::string()> gather;
  };

  /// Runtime, OS, host, memory-limit and integration probes for \p config.
  std::vector<EnvironmentProbe> defaultProbes(const ReporterConfig& config);

  /**
 * @class EnvironmentCollector
 * @brief Runs every probe once and memoises the snapshot until `invalidate()`.
 *
 * * A throwing probe yields a placeholder value; the remaining probes still run.
 */
  class EnvironmentCollector {
  public:
    EnvironmentCollector(std::vector<EnvironmentProbe> probes,
                         std::shared_ptr<ErrorMonitor> monitor);

    const EnvironmentSnapshot& collect();
    void invalidate() { snapshot_.reset(); }

    std::size_t probeCount() const { return probes_.size(); }

    static std::string placeholder(const std::string& reason);

  private:
    std::vector<EnvironmentProbe> probes_;
    std::shared_ptr<ErrorMonitor> monitor_;
    std::optional<EnvironmentSnapshot> snapshot_;
  };

} // namespace crashwatch::core
