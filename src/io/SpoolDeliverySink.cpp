/* @file SpoolDeliverySink.cpp
 * @brief spool-directory hand-off for a downstream mailer.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring> // for strerror
#include <fstream>
#include <iostream>
#include <system_error>

// Linux headers
#include <unistd.h>

// CrashWatch headers
#include "io/SpoolDeliverySink.hpp"

using namespace crashwatch::io;

namespace {

  std::string baseName(const crashwatch::protocols::ReportPayload& payload) {
    std::string name = std::to_string(payload.timestamp) + "-" +
                       (payload.reference_id.empty() ? "report" : payload.reference_id);
    if (!payload.signature.empty())
      name += "-" + payload.signature;
    return name;
  }

} // namespace

SpoolDeliverySink::SpoolDeliverySink(std::filesystem::path spoolDir) : dir_(std::move(spoolDir)) {}

bool SpoolDeliverySink::send(const protocols::ReportPayload& payload) {
  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    std::cerr << "[SpoolDeliverySink] cannot create " << dir_ << ": " << ec.message() << "\n";
    return false;
  }

  const std::string name = baseName(payload);
  const auto tmpPath = dir_ / (name + ".json.tmp." + std::to_string(::getpid()));

  {
    std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
    if (!out) {
      std::cerr << "[SpoolDeliverySink] cannot open " << tmpPath << "\n";
      return false;
    }
    out << payload.toWire() << '\n';
    out.flush();
    if (!out) {
      std::cerr << "[SpoolDeliverySink] write failed for " << tmpPath << "\n";
      out.close();
      std::filesystem::remove(tmpPath, ec);
      return false;
    }
  }

  const bool published = publish(tmpPath, name);
  std::error_code ignored;
  std::filesystem::remove(tmpPath, ignored);
  return published;
}

bool SpoolDeliverySink::publish(const std::filesystem::path& tmpPath, const std::string& name) {
  // link(2) never replaces an existing entry, so a name clash gets a sequence suffix
  for (unsigned seq = 0; seq < kMaxNameAttempts; ++seq) {
    const auto finalPath =
        dir_ / (seq == 0 ? name + ".json" : name + "." + std::to_string(seq) + ".json");
    if (::link(tmpPath.c_str(), finalPath.c_str()) == 0)
      return true;
    if (errno != EEXIST) {
      std::cerr << "[SpoolDeliverySink] link " << finalPath << " failed: " << strerror(errno)
                << "\n";
      return false;
    }
  }
  std::cerr << "[SpoolDeliverySink] no free spool name for " << name << "\n";
  return false;
}
