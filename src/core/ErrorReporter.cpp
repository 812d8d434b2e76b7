/* @file ErrorReporter.cpp
 * @brief report pipeline state machine: gates, enrichment, delivery, record.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <cstdlib>
#include <system_error>
#include <typeinfo>

// Linux / ABI headers
#include <cxxabi.h>

// CrashWatch headers
#include "core/ErrorReporter.hpp"
#include "core/MemoryStore.hpp"
#include "core/Sanitize.hpp"
#include "core/Signature.hpp"

using namespace crashwatch::core;
using crashwatch::protocols::ErrorReport;
using crashwatch::protocols::ReportPayload;

namespace {

  constexpr const char* kComponent = "ErrorReporter";

  std::shared_ptr<Logger> makeLogger(const ReporterConfig& config, std::shared_ptr<Clock> clock) {
    auto logger = std::make_shared<Logger>(std::move(clock));
    if (!config.diagnostics_log_path.empty() && !logger->open(config.diagnostics_log_path))
      logger->warn(kComponent, "cannot open diagnostics log " + config.diagnostics_log_path +
                                   ", using stderr");
    return logger;
  }

  std::string demangledTypeName(const std::exception& error) {
    const char* mangled = typeid(error).name();
    int status = 0;
    char* demangled = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    if (status != 0 || demangled == nullptr)
      return mangled;
    std::string name(demangled);
    std::free(demangled);
    return name;
  }

  std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
      if (!out.empty())
        out += ", ";
      out += n;
    }
    return out;
  }

} // namespace

const char* crashwatch::core::toString(ReportState state) {
  switch (state) {
  case ReportState::Received:
    return "Received";
  case ReportState::Validated:
    return "Validated";
  case ReportState::DedupChecked:
    return "DedupChecked";
  case ReportState::RateChecked:
    return "RateChecked";
  case ReportState::Enriched:
    return "Enriched";
  case ReportState::Delivered:
    return "Delivered";
  case ReportState::Skipped:
    return "Skipped";
  case ReportState::Rejected:
    return "Rejected";
  case ReportState::Failed:
    return "Failed";
  default:
    return "Unknown";
  }
}

ErrorReporter::ErrorReporter(ReporterConfig config, ReporterDependencies deps)
    : config_(std::move(config)), sink_(std::move(deps.sink)),
      clock_(deps.clock ? std::move(deps.clock) : std::make_shared<SystemClock>()),
      logger_(deps.logger ? std::move(deps.logger) : makeLogger(config_, clock_)),
      monitor_(deps.monitor ? std::move(deps.monitor) : std::make_shared<ErrorMonitor>(logger_)),
      duplicates_(deps.dedupStore ? std::move(deps.dedupStore)
                                  : std::make_shared<MemoryDedupStore>(),
                  clock_, monitor_,
                  DuplicateFilter::Options{ config_.track_duration_seconds,
                                            config_.max_tracked_entries, config_.version_tag }),
      rateLimiter_(deps.rateStore ? std::move(deps.rateStore)
                                  : std::make_shared<MemoryCounterStore>(clock_),
                   clock_, monitor_,
                   RateLimiter::Options{ config_.rate_window_seconds,
                                         config_.max_reports_per_window,
                                         config_.rate_limiting_enabled, config_.site_id }),
      environment_(deps.probes ? std::move(*deps.probes) : defaultProbes(config_), monitor_),
      tailReader_(config_.log_chunk_bytes, config_.log_max_bytes) {
  assert(sink_ && "[ErrorReporter] delivery sink is nullptr");
}

//---caller API----------------------------------------------------------

bool ErrorReporter::report(const ErrorReport& report) { return submit(report).accepted(); }

ReportOutcome ErrorReporter::submit(ErrorReport report) {
  std::lock_guard<std::mutex> lock(runMtx_);
  try {
    return run(report);
  } catch (const std::exception& e) {
    // anything not already classified by a stage lands here
    ReportOutcome outcome;
    outcome.signature = duplicates_.signatureOf(report);
    logger_->error(kComponent, std::string("report pipeline aborted: ") + e.what());
    return finish(outcome, ReportState::Failed, "internal", e.what());
  } catch (...) {
    ReportOutcome outcome;
    logger_->error(kComponent, "report pipeline aborted: non-standard exception");
    return finish(outcome, ReportState::Failed, "internal", "non-standard exception");
  }
}

bool ErrorReporter::reportFromException(const std::exception& error, const SourceContext& context) {
  ErrorReport report;
  report.message = error.what();
  report.file = context.file;
  report.line = context.line;
  report.stack_trace = context.stack_trace;
  report.extra = context.extra;
  report.is_critical = context.is_critical;
  report.extra["exception_type"] = demangledTypeName(error);

  if (!context.code.empty()) {
    report.code = context.code;
  } else if (const auto* sysErr = dynamic_cast<const std::system_error*>(&error)) {
    report.code = std::to_string(sysErr->code().value());
    report.extra["error_category"] = sysErr->code().category().name();
  } else {
    report.code = "exception";
  }

  return submit(std::move(report)).accepted();
}

//---administration------------------------------------------------------

bool ErrorReporter::clearTrackedErrors() {
  std::lock_guard<std::mutex> lock(runMtx_);
  const bool ok = duplicates_.clearAll();
  logger_->info(kComponent, ok ? "tracked errors cleared" : "clearing tracked errors failed");
  return ok;
}

bool ErrorReporter::resetRateLimit() {
  std::lock_guard<std::mutex> lock(runMtx_);
  const bool ok = rateLimiter_.reset();
  logger_->info(kComponent, ok ? "rate limit reset" : "rate limit reset failed");
  return ok;
}

ReporterStats ErrorReporter::stats() {
  std::lock_guard<std::mutex> lock(runMtx_);
  duplicates_.beginRun();
  ReporterStats s;
  s.tracked_errors = duplicates_.count();
  s.rate_limit_remaining = rateLimiter_.remaining();
  s.window_expires = rateLimiter_.windowExpires();
  return s;
}

std::vector<std::string> ErrorReporter::missingFields(const ErrorReport& report) const {
  std::vector<std::string> missing;
  for (const auto& field : config_.required_fields) {
    bool present = false;
    if (field == "message")
      present = !report.message.empty();
    else if (field == "code")
      present = !report.code.empty();
    else if (field == "file")
      present = !report.file.empty();
    else if (field == "line")
      present = report.line > 0;
    else if (field == "stack_trace")
      present = !report.stack_trace.empty();
    else {
      auto it = report.extra.find(field);
      present = it != report.extra.end() && !it->second.empty();
    }

    if (!present)
      missing.push_back(field);
  }
  return missing;
}

std::string ErrorReporter::relativePath(const std::string& file) const {
  const auto& root = config_.source_root;
  if (root.empty() || file.rfind(root, 0) != 0)
    return file;

  std::string rel = file.substr(root.size());
  while (!rel.empty() && rel.front() == '/')
    rel.erase(rel.begin());
  return rel.empty() ? file : rel;
}

//---pipeline------------------------------------------------------------

ReportOutcome ErrorReporter::run(ErrorReport& report) {
  ReportOutcome outcome;
  transitionTo(outcome, ReportState::Received);

  if (report.timestamp == 0)
    report.timestamp = clock_->now();

  // per-run memo caches start cold
  duplicates_.beginRun();
  environment_.invalidate();

  // Received → Validated
  const auto missing = missingFields(report);
  if (!missing.empty()) {
    return finish(outcome, ReportState::Rejected, "validation",
                  "missing required field(s): " + joinNames(missing));
  }
  transitionTo(outcome, ReportState::Validated);
  outcome.signature = duplicates_.signatureOf(report);

  // Validated → DedupChecked
  const bool bypassDedup = report.is_critical || report.bypass_duplicate_check;
  if (!bypassDedup && duplicates_.isDuplicate(report)) {
    logger_->info(kComponent, "duplicate error skipped: " + report.message);
    return finish(outcome, ReportState::Skipped, "duplicate");
  }
  transitionTo(outcome, ReportState::DedupChecked);

  // DedupChecked → RateChecked
  if (!rateLimiter_.canSend()) {
    if (!report.is_critical) {
      logger_->warn(kComponent, "rate limit exceeded, report dropped: " + report.message);
      return finish(outcome, ReportState::Rejected, "rate_limited", "rate limit exceeded");
    }
    logger_->info(kComponent, "critical error, resetting rate window");
    rateLimiter_.reset();
  }
  transitionTo(outcome, ReportState::RateChecked);

  // RateChecked → Enriched
  const ReportPayload payload = enrich(report, outcome);
  transitionTo(outcome, ReportState::Enriched);

  // Enriched → Delivered | Failed
  bool sent = false;
  std::string failure;
  try {
    sent = sink_->send(payload);
    if (!sent)
      failure = "delivery sink returned false";
  } catch (const std::exception& e) {
    failure = std::string("delivery sink threw: ") + e.what();
  } catch (...) {
    failure = "delivery sink threw a non-standard exception";
  }

  if (!sent) {
    monitor_->notifyFailure(FailureKind::Delivery,
                            "[ErrorReporter] " + failure + " (ref " + outcome.reference_id + ")");
    return finish(outcome, ReportState::Failed, "delivery_failed", failure);
  }

  // Record
  duplicates_.markReported(report);
  rateLimiter_.increment();
  logger_->info(kComponent, "error report sent, ref " + outcome.reference_id);
  return finish(outcome, ReportState::Delivered, "");
}

ReportPayload ErrorReporter::enrich(const ErrorReport& report, ReportOutcome& outcome) {
  ReportPayload payload;
  payload.error_message = sanitizeText(report.message);
  payload.error_code = sanitizeText(report.code);
  payload.relative_file_path = sanitizeText(relativePath(report.file));
  payload.error_line = report.line;
  payload.stack_trace = sanitizeText(report.stack_trace, true);
  payload.timestamp = report.timestamp;
  payload.site_id = config_.site_id;
  payload.extra = sanitizeFields(report.extra);
  payload.signature = outcome.signature;

  payload.severity = toString(classifySeverity(report.code, report.message));
  payload.reference_id =
      computeReferenceId(config_.site_id, report.file, report.line, report.timestamp);
  payload.environment = environment_.collect();
  if (config_.include_log_tail)
    payload.log_tail = readLogTail();

  outcome.severity = payload.severity;
  outcome.reference_id = payload.reference_id;
  return payload;
}

std::string ErrorReporter::readLogTail() {
  if (config_.log_path.empty())
    return {};

  const auto result = tailReader_.tail(config_.log_path, config_.log_tail_lines);
  if (!result.error.empty()) {
    monitor_->notifyFailure(FailureKind::LogRead, "[ErrorReporter] " + result.error);
    return {};
  }
  return result.joined();
}

void ErrorReporter::transitionTo(ReportOutcome& outcome, ReportState next) {
  outcome.state = next;
  outcome.trail.push_back(next);
  logger_->debug(kComponent, std::string("state -> ") + toString(next));
}

ReportOutcome& ErrorReporter::finish(ReportOutcome& outcome, ReportState terminal,
                                     std::string reason, std::string detail) {
  transitionTo(outcome, terminal);
  outcome.reason = std::move(reason);
  outcome.detail = std::move(detail);
  if (terminal == ReportState::Rejected || terminal == ReportState::Failed) {
    logger_->warn(kComponent, std::string(toString(terminal)) + " (" + outcome.reason +
                                  "): " + outcome.detail);
  }
  return outcome;
}
