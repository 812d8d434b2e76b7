/* @file EnvironmentCollector.cpp
 * @brief probe isolation + default Linux probe set.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <cerrno>
#include <cstring> // for strerror
#include <stdexcept>

// Linux headers
#include <sys/resource.h>
#include <sys/utsname.h>
#include <unistd.h>

// CrashWatch headers
#include "core/EnvironmentCollector.hpp"

namespace crashwatch::core {

  namespace {

    std::string joinList(const std::vector<std::string>& items) {
      std::string out;
      for (const auto& item : items) {
        if (!out.empty())
          out += ", ";
        out += item;
      }
      return out;
    }

    std::string runtimeVersion() {
#if defined(__clang__)
      std::string compiler = "clang " __clang_version__;
#elif defined(__GNUC__)
      std::string compiler = "gcc " __VERSION__;
#else
      std::string compiler = "unknown compiler";
#endif
      return compiler + " / C++" + std::to_string(__cplusplus);
    }

    std::string osDescription() {
      struct utsname info {};
      if (::uname(&info) != 0)
        throw std::runtime_error(std::string("uname: ") + strerror(errno));
      return std::string(info.sysname) + " " + info.release + " (" + info.machine + ")";
    }

    std::string hostName() {
      char name[256] = { 0 };
      if (::gethostname(name, sizeof(name) - 1) != 0)
        throw std::runtime_error(std::string("gethostname: ") + strerror(errno));
      return name;
    }

    std::string memoryLimit() {
      struct rlimit lim {};
      if (::getrlimit(RLIMIT_AS, &lim) != 0)
        throw std::runtime_error(std::string("getrlimit: ") + strerror(errno));
      if (lim.rlim_cur == RLIM_INFINITY)
        return "unlimited";
      return std::to_string(static_cast<unsigned long long>(lim.rlim_cur));
    }

    std::string orUnknown(const std::string& value) { return value.empty() ? "unknown" : value; }

  } // namespace

  std::vector<EnvironmentProbe> defaultProbes(const ReporterConfig& config) {
    std::vector<EnvironmentProbe> probes;
    probes.push_back({ "runtime_version", runtimeVersion });
    probes.push_back({ "os", osDescription });
    probes.push_back({ "hostname", hostName });
    probes.push_back({ "process_id", [] { return std::to_string(::getpid()); } });
    probes.push_back({ "memory_limit", memoryLimit });
    probes.push_back(
        { "host_version", [v = config.host_version] { return orUnknown(v); } });
    probes.push_back(
        { "plugin_version", [v = config.plugin_version] { return orUnknown(v); } });
    probes.push_back({ "active_integrations", [list = config.integrations] {
                        return list.empty() ? std::string("none") : joinList(list);
                      } });
    probes.push_back({ "site_id", [v = config.site_id] { return v; } });
    return probes;
  }

  EnvironmentCollector::EnvironmentCollector(std::vector<EnvironmentProbe> probes,
                                             std::shared_ptr<ErrorMonitor> monitor)
      : probes_(std::move(probes)), monitor_(std::move(monitor)) {
    assert(monitor_ && "[EnvironmentCollector] error monitor is nullptr");
  }

  std::string EnvironmentCollector::placeholder(const std::string& reason) {
    return "unavailable (" + reason + ")";
  }

  const EnvironmentSnapshot& EnvironmentCollector::collect() {
    if (snapshot_)
      return *snapshot_;

    EnvironmentSnapshot snapshot;
    for (const auto& probe : probes_) {
      try {
        if (!probe.gather)
          throw std::logic_error("probe has no gather function");
        snapshot[probe.key] = probe.gather();
      } catch (const std::exception& e) {
        snapshot[probe.key] = placeholder(e.what());
        monitor_->notifyFailure(FailureKind::Probe, "[EnvironmentCollector] probe '" + probe.key +
                                                        "' failed: " + e.what());
      } catch (...) {
        snapshot[probe.key] = placeholder("non-standard exception");
        monitor_->notifyFailure(FailureKind::Probe, "[EnvironmentCollector] probe '" + probe.key +
                                                        "' failed: non-standard exception");
      }
    }

    snapshot_ = std::move(snapshot);
    return *snapshot_;
  }

} // namespace crashwatch::core
