#pragma once
/** @file  Clock.hpp
 *  @brief Injectable wall-clock used by every TTL decision.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>

namespace crashwatch::core {

  /**
 * @class Clock
 * @brief Source of "now" in unix seconds.
 *
 *  * Dedup TTLs, rate windows and store expiry all read the same clock so a
 *    test can move time forward with a single fake.
 */
  class Clock {
  public:
    virtual ~Clock() = default;

    /// Current time as seconds since the unix epoch.
    virtual std::int64_t now() const = 0;
  };

  class SystemClock : public Clock {
  public:
    std::int64_t now() const override {
      return std::chrono::duration_cast<std::chrono::seconds>(
                 std::chrono::system_clock::now().time_since_epoch())
          .count();
    }
  };

} // namespace crashwatch::core
