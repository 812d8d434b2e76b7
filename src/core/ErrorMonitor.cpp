/* @file ErrorMonitor.cpp
 * @brief failure classification, logging and one-shot escalation.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <numeric>

// CrashWatch headers
#include "core/ErrorMonitor.hpp"

namespace crashwatch {
  namespace core {

    const char* toString(FailureKind kind) {
      switch (kind) {
      case FailureKind::Storage:
        return "storage";
      case FailureKind::Probe:
        return "probe";
      case FailureKind::Delivery:
        return "delivery";
      case FailureKind::LogRead:
        return "log_read";
      default:
        return "unknown";
      }
    }

    ErrorMonitor::ErrorMonitor(std::shared_ptr<Logger> logger) : logger_(std::move(logger)) {}

    void ErrorMonitor::registerEscalation(Escalation cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(FailureKind kind, const std::string& message) {
      if (kind == FailureKind::Count)
        return;

      {
        std::lock_guard<std::mutex> lock(mtx_);
        ++counts_[static_cast<std::size_t>(kind)];
      }

      if (logger_)
        logger_->warn("ErrorMonitor", std::string("[") + toString(kind) + "] " + message);

      forwardIfNew(kind, message);
    }

    void ErrorMonitor::forwardIfNew(FailureKind kind, const std::string& message) {
      Escalation cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        const std::string key = std::string(toString(kind)) + ":" + message;
        if (std::find(seen_.begin(), seen_.end(), key) != seen_.end())
          return;
        if (seen_.size() >= kMaxSeen)
          seen_.erase(seen_.begin());
        seen_.push_back(key);
        cb = escalation_;
      }
      // invoked outside the lock so the callback may query the monitor
      if (cb)
        cb(kind, message);
    }

    std::size_t ErrorMonitor::failureCount(FailureKind kind) const {
      if (kind == FailureKind::Count)
        return 0;
      std::lock_guard<std::mutex> lock(mtx_);
      return counts_[static_cast<std::size_t>(kind)];
    }

    std::size_t ErrorMonitor::totalFailures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return std::accumulate(counts_.begin(), counts_.end(), std::size_t{ 0 });
    }

  } // namespace core
} // namespace crashwatch
