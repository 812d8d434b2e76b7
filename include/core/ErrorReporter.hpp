#pragma once

/** @file  ErrorReporter.hpp
 *  @brief Public API for crashwatch::core::ErrorReporter, the report pipeline.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/Clock.hpp"
#include "core/DuplicateFilter.hpp"
#include "core/EnvironmentCollector.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/KeyValueStore.hpp"
#include "core/Logger.hpp"
#include "core/RateLimiter.hpp"
#include "core/ReporterConfig.hpp"
#include "core/Severity.hpp"
#include "io/DeliverySink.hpp"
#include "io/LogTailReader.hpp"
#include "protocols/ErrorReport.hpp"
#include "protocols/ReportPayload.hpp"

namespace crashwatch {
  namespace core {

    enum class ReportState {
      Received,
      Validated,
      DedupChecked,
      RateChecked,
      Enriched,
      Delivered,
      Skipped,
      Rejected,
      Failed
    };

    const char* toString(ReportState state);

    /// Terminal result of one pipeline run.
    struct ReportOutcome {
      ReportState state{ ReportState::Received };
      std::string reason; ///< "validation", "duplicate", "rate_limited", "delivery_failed", "internal"
      std::string detail;
      std::string signature;
      std::string reference_id;
      std::string severity;
      std::vector<ReportState> trail; ///< every state visited, in order

      /// Delivered, or Skipped as a duplicate (nothing went wrong from the caller's view).
      bool accepted() const {
        return state == ReportState::Delivered || state == ReportState::Skipped;
      }
    };

    struct ReporterStats {
      std::size_t tracked_errors{ 0 };
      int rate_limit_remaining{ 0 };
      std::int64_t window_expires{ 0 };
    };

    /// Where an exception was caught, for `reportFromException()`.
    struct SourceContext {
      std::string file;
      int line{ 0 };
      std::string code; ///< empty: taken from std::system_error, else "exception"
      std::string stack_trace;
      std::map<std::string, std::string> extra;
      bool is_critical{ false };
    };

    /// Collaborators injected into the pipeline; null members get in-process defaults.
    struct ReporterDependencies {
      std::shared_ptr<io::DeliverySink> sink; ///< required
      std::shared_ptr<DedupStore> dedupStore;
      std::shared_ptr<RateCounterStore> rateStore;
      std::shared_ptr<Clock> clock;
      std::shared_ptr<Logger> logger;
      std::shared_ptr<ErrorMonitor> monitor;
      std::optional<std::vector<EnvironmentProbe>> probes; ///< nullopt: defaultProbes(config)
    };

    /**
 * @class ErrorReporter
 * @brief Validate → Dedup → RateLimit → Enrich → Deliver → Record, one run per incident.
 *
 * * Runs synchronously on the caller's thread; never throws out of `report()`.
 * * Runs and admin calls are serialised on one mutex, so a reporter may be shared.
 * * Validation is the only strict stage; every other fault degrades to a
 *   permissive gate or a placeholder and is recorded on the ErrorMonitor.
 * * `is_critical` bypasses both gates (and resets the rate window);
 *   `bypass_duplicate_check` bypasses the duplicate gate only.
 */
    class ErrorReporter {

    public:
      ErrorReporter(ReporterConfig config, ReporterDependencies deps);
      ~ErrorReporter() = default;

      // ---- caller API ----------------------------------------------------------
      bool report(const protocols::ErrorReport& report); ///< true if Delivered or Skipped
      ReportOutcome submit(protocols::ErrorReport report);
      bool reportFromException(const std::exception& error, const SourceContext& context);

      // ---- administration ------------------------------------------------------
      bool clearTrackedErrors();
      bool resetRateLimit();
      ReporterStats stats();

      /// Names from `required_fields` that are empty in \p report.
      std::vector<std::string> missingFields(const protocols::ErrorReport& report) const;

      /// \p file with the configured source root stripped.
      std::string relativePath(const std::string& file) const;

      const ReporterConfig& config() const { return config_; }
      ErrorMonitor& monitor() { return *monitor_; }

    private:
      ReportOutcome run(protocols::ErrorReport& report);
      protocols::ReportPayload enrich(const protocols::ErrorReport& report,
                                      ReportOutcome& outcome);
      std::string readLogTail();

      void transitionTo(ReportOutcome& outcome, ReportState next);
      ReportOutcome& finish(ReportOutcome& outcome, ReportState terminal, std::string reason,
                            std::string detail = {});

      ReporterConfig config_;
      std::shared_ptr<io::DeliverySink> sink_;
      std::shared_ptr<Clock> clock_;
      std::shared_ptr<Logger> logger_;
      std::shared_ptr<ErrorMonitor> monitor_;
      DuplicateFilter duplicates_;
      RateLimiter rateLimiter_;
      EnvironmentCollector environment_;
      io::LogTailReader tailReader_;
      std::mutex runMtx_; ///< guards the per-run caches in duplicates_ and environment_
    };

  } // namespace core
} // namespace crashwatch
