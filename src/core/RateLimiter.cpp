/* @file RateLimiter.cpp
 * @brief fixed-window counter over a TTL store.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cassert>

// CrashWatch headers
#include "core/RateLimiter.hpp"
#include "core/Signature.hpp"

using namespace crashwatch::core;

namespace {
  constexpr const char* kKeyPrefix = "crashwatch_error_rate_";
}

RateLimiter::RateLimiter(std::shared_ptr<RateCounterStore> store, std::shared_ptr<Clock> clock,
                         std::shared_ptr<ErrorMonitor> monitor, Options options)
    : store_(std::move(store)), clock_(std::move(clock)), monitor_(std::move(monitor)),
      options_(std::move(options)), key_(kKeyPrefix + crc32Hex(options_.siteId)) {
  assert(store_ && "[RateLimiter] store is nullptr");
  assert(clock_ && "[RateLimiter] clock is nullptr");
  assert(monitor_ && "[RateLimiter] error monitor is nullptr");
}

bool RateLimiter::canSend() {
  if (!options_.enabled)
    return true;

  try {
    return std::max(store_->get(key_), 0) < options_.maxPerWindow;
  } catch (const std::exception& e) {
    monitor_->notifyFailure(FailureKind::Storage,
                            std::string("[RateLimiter] rate limit check failed: ") + e.what());
    return true; // allow on error
  } catch (...) {
    monitor_->notifyFailure(FailureKind::Storage,
                            "[RateLimiter] rate limit check failed: non-standard exception");
    return true;
  }
}

void RateLimiter::increment() {
  try {
    const int current = std::max(store_->get(key_), 0);

    // keep the window's original expiry; only the first increment opens a window
    std::int64_t ttl = options_.windowSeconds;
    if (current > 0) {
      const std::int64_t expires = store_->getExpiry(key_);
      if (expires > 0)
        ttl = std::max<std::int64_t>(expires - clock_->now(), 1);
    }

    store_->set(key_, current + 1, ttl);
  } catch (const std::exception& e) {
    monitor_->notifyFailure(FailureKind::Storage,
                            std::string("[RateLimiter] increment failed: ") + e.what());
  } catch (...) {
    monitor_->notifyFailure(FailureKind::Storage,
                            "[RateLimiter] increment failed: non-standard exception");
  }
}

bool RateLimiter::reset() {
  try {
    store_->erase(key_);
    return true;
  } catch (const std::exception& e) {
    monitor_->notifyFailure(FailureKind::Storage,
                            std::string("[RateLimiter] reset failed: ") + e.what());
    return false;
  } catch (...) {
    monitor_->notifyFailure(FailureKind::Storage,
                            "[RateLimiter] reset failed: non-standard exception");
    return false;
  }
}

int RateLimiter::remaining() {
  try {
    return std::max(0, options_.maxPerWindow - std::max(store_->get(key_), 0));
  } catch (const std::exception& e) {
    monitor_->notifyFailure(FailureKind::Storage,
                            std::string("[RateLimiter] remaining lookup failed: ") + e.what());
    return options_.maxPerWindow;
  } catch (...) {
    monitor_->notifyFailure(FailureKind::Storage,
                            "[RateLimiter] remaining lookup failed: non-standard exception");
    return options_.maxPerWindow;
  }
}

std::int64_t RateLimiter::windowExpires() {
  try {
    return store_->getExpiry(key_);
  } catch (const std::exception& e) {
    monitor_->notifyFailure(FailureKind::Storage,
                            std::string("[RateLimiter] expiry lookup failed: ") + e.what());
    return 0;
  } catch (...) {
    monitor_->notifyFailure(FailureKind::Storage,
                            "[RateLimiter] expiry lookup failed: non-standard exception");
    return 0;
  }
}
