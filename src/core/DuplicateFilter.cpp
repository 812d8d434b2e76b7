/* @file DuplicateFilter.cpp
 * @brief signature tracking with TTL, hard cap and fail-open reads.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cassert>
#include <utility>
#include <vector>

// CrashWatch headers
#include "core/DuplicateFilter.hpp"
#include "core/Signature.hpp"

using namespace crashwatch::core;
using crashwatch::protocols::ErrorReport;

DuplicateFilter::DuplicateFilter(std::shared_ptr<DedupStore> store, std::shared_ptr<Clock> clock,
                                 std::shared_ptr<ErrorMonitor> monitor, Options options)
    : store_(std::move(store)), clock_(std::move(clock)), monitor_(std::move(monitor)),
      options_(std::move(options)) {
  assert(store_ && "[DuplicateFilter] store is nullptr");
  assert(clock_ && "[DuplicateFilter] clock is nullptr");
  assert(monitor_ && "[DuplicateFilter] error monitor is nullptr");
}

std::string DuplicateFilter::signatureOf(const ErrorReport& report) const {
  return computeSignature(report, options_.versionTag);
}

bool DuplicateFilter::isDuplicate(const ErrorReport& report) {
  try {
    const auto& entries = tracked();
    auto it = entries.find(signatureOf(report));
    if (it == entries.end())
      return false;
    return (clock_->now() - it->second) < options_.ttlSeconds;
  } catch (const std::exception& e) {
    monitor_->notifyFailure(FailureKind::Storage,
                            std::string("[DuplicateFilter] duplicate check failed: ") + e.what());
    cache_.reset();
    return false; // let the report through
  } catch (...) {
    monitor_->notifyFailure(FailureKind::Storage,
                            "[DuplicateFilter] duplicate check failed: non-standard exception");
    cache_.reset();
    return false;
  }
}

bool DuplicateFilter::markReported(const ErrorReport& report) {
  try {
    const std::int64_t now = clock_->now();
    const std::string signature = signatureOf(report);
    auto& entries = tracked();

    entries[signature] = now;
    store_->set(signature, now);

    if (entries.size() > options_.maxTracked) {
      TrackedErrors before = entries;
      dropExpired(entries, now);
      if (entries.size() > options_.maxTracked)
        evictOldest(entries, options_.maxTracked);

      for (const auto& [sig, ts] : before) {
        if (entries.find(sig) == entries.end())
          store_->erase(sig);
      }
    }
    return true;
  } catch (const std::exception& e) {
    monitor_->notifyFailure(FailureKind::Storage,
                            std::string("[DuplicateFilter] mark reported failed: ") + e.what());
    cache_.reset();
    return false;
  } catch (...) {
    monitor_->notifyFailure(FailureKind::Storage,
                            "[DuplicateFilter] mark reported failed: non-standard exception");
    cache_.reset();
    return false;
  }
}

bool DuplicateFilter::clearAll() {
  cache_.reset();
  try {
    store_->deleteAll();
    return true;
  } catch (const std::exception& e) {
    monitor_->notifyFailure(FailureKind::Storage,
                            std::string("[DuplicateFilter] clear failed: ") + e.what());
    return false;
  } catch (...) {
    monitor_->notifyFailure(FailureKind::Storage,
                            "[DuplicateFilter] clear failed: non-standard exception");
    return false;
  }
}

std::size_t DuplicateFilter::count() {
  try {
    return tracked().size();
  } catch (const std::exception& e) {
    monitor_->notifyFailure(FailureKind::Storage,
                            std::string("[DuplicateFilter] count failed: ") + e.what());
    cache_.reset();
    return 0;
  } catch (...) {
    monitor_->notifyFailure(FailureKind::Storage,
                            "[DuplicateFilter] count failed: non-standard exception");
    cache_.reset();
    return 0;
  }
}

TrackedErrors& DuplicateFilter::tracked() {
  if (cache_)
    return *cache_;

  TrackedErrors loaded = store_->getAll();
  const std::size_t before = loaded.size();
  TrackedErrors kept = loaded;
  dropExpired(kept, clock_->now());

  if (kept.size() != before) {
    for (const auto& [sig, ts] : loaded) {
      if (kept.find(sig) == kept.end())
        store_->erase(sig);
    }
  }

  cache_ = std::move(kept);
  return *cache_;
}

void DuplicateFilter::dropExpired(TrackedErrors& entries, std::int64_t now) {
  for (auto it = entries.begin(); it != entries.end();) {
    if ((now - it->second) >= options_.ttlSeconds)
      it = entries.erase(it);
    else
      ++it;
  }
}

void DuplicateFilter::evictOldest(TrackedErrors& entries, std::size_t keep) {
  if (entries.size() <= keep)
    return;

  std::vector<std::pair<std::int64_t, std::string>> byAge;
  byAge.reserve(entries.size());
  for (const auto& [sig, ts] : entries)
    byAge.emplace_back(ts, sig);

  const std::size_t drop = entries.size() - keep;
  std::nth_element(byAge.begin(), byAge.begin() + static_cast<std::ptrdiff_t>(drop - 1),
                   byAge.end());
  for (std::size_t i = 0; i < drop; ++i)
    entries.erase(byAge[i].second);
}
