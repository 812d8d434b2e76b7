#pragma once
/** @file  RateLimiter.hpp
 *  @brief Fixed-window cap on outbound reports per tenant.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <memory>
#include <string>

#include "core/Clock.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/KeyValueStore.hpp"

namespace crashwatch::core {

  /**
 * @class RateLimiter
 * @brief One counter per tenant that lives exactly one window.
 *
 * * The counter's store TTL is the window: an idle window resets itself, no sweep.
 * * Fixed window, so up to ~2x the cap can pass across a window boundary.
 * * `canSend()` fails open when the store is unreachable.
 */
  class RateLimiter {
  public:
    struct Options {
      std::int64_t windowSeconds{ 600 };
      int maxPerWindow{ 5 };
      bool enabled{ true };
      std::string siteId{ "default" };
    };

    RateLimiter(std::shared_ptr<RateCounterStore> store, std::shared_ptr<Clock> clock,
                std::shared_ptr<ErrorMonitor> monitor, Options options);

    bool canSend();
    void increment();
    bool reset();

    int remaining();
    std::int64_t windowExpires(); ///< unix time, 0 when no window is open

    const std::string& key() const { return key_; }

  private:
    std::shared_ptr<RateCounterStore> store_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<ErrorMonitor> monitor_;
    Options options_;
    std::string key_; ///< tenant-scoped counter key
  };

} // namespace crashwatch::core
