#pragma once
/** @file  FakeClock.hpp
 *  @brief Clock derivative whose time only moves when the test says so.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "core/Clock.hpp"

namespace crashwatch {
  namespace test {

    class FakeClock : public crashwatch::core::Clock {
    public:
      static constexpr std::int64_t kEpoch = 1'700'000'000;

      explicit FakeClock(std::int64_t start = kEpoch) : now_(start) {}

      std::int64_t now() const override { return now_; }

      void advance(std::int64_t seconds) { now_ += seconds; }
      void set(std::int64_t unixTime) { now_ = unixTime; }

    private:
      std::int64_t now_;
    };

  } // namespace test
} // namespace crashwatch
