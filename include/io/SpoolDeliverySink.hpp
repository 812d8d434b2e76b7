#pragma once
/** @file  SpoolDeliverySink.hpp
 *  @brief DeliverySink that drops each payload as a JSON file into a spool directory.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <filesystem>
#include <string>

#include "io/DeliverySink.hpp"

namespace crashwatch {
  namespace io {

    /**
 * @class SpoolDeliverySink
 * @brief Writes `<timestamp>-<reference_id>-<signature>.json` atomically (tmp + link).
 *
 *  * A separate mailer process owns templating and SMTP; this sink only hands off.
 *  * An existing spool file is never replaced; a clashing name gets a `.N` suffix.
 *  * Returns false on any filesystem error, never throws.
 */
    class SpoolDeliverySink : public DeliverySink {
    public:
      explicit SpoolDeliverySink(std::filesystem::path spoolDir);

      bool send(const protocols::ReportPayload& payload) override;

      const std::filesystem::path& spoolDir() const { return dir_; }

    private:
      static constexpr unsigned kMaxNameAttempts = 1000;

      bool publish(const std::filesystem::path& tmpPath, const std::string& name);

      std::filesystem::path dir_;
    };

  } // namespace io
} // namespace crashwatch
