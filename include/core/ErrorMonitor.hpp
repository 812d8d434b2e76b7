#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Local diagnostics channel: classifies and records self-degradation.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/Logger.hpp"

namespace crashwatch::core {

  /// Non-fatal failure classes; each degrades to a safe default.
  enum class FailureKind { Storage, Probe, Delivery, LogRead, Count };

  const char* toString(FailureKind kind);

  /**
 * @class ErrorMonitor
 * @brief Components call `notifyFailure()` when they swallow a fault; we log it,
 *        count it and call the registered escalation callback once per unique error.
 *
 * * Distinct from the delivery path: this is how operators see the reporter degrading.
 * * Thread-safe (mutex-protected counters and de-dupe list).
 */
  class ErrorMonitor {
  public:
    using Escalation = std::function<void(FailureKind, const std::string&)>;

    explicit ErrorMonitor(std::shared_ptr<Logger> logger = nullptr);
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fault to the host (e.g. its own log sink).
    void registerEscalation(Escalation cb);

    /// Called by components on fault; logs, counts and forwards to the escalation callback.
    virtual void notifyFailure(FailureKind kind, const std::string& message);

    std::size_t failureCount(FailureKind kind) const;
    std::size_t totalFailures() const;

  private:
    static constexpr std::size_t kMaxSeen = 256;

    void forwardIfNew(FailureKind kind, const std::string& message);

    std::shared_ptr<Logger> logger_;
    Escalation escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    std::array<std::size_t, static_cast<std::size_t>(FailureKind::Count)> counts_{};
    mutable std::mutex mtx_;
  };

} // namespace crashwatch::core
