#pragma once
/** @file  DuplicateFilter.hpp
 *  @brief Suppresses repeat reports of the same bug inside a tracking window.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "core/Clock.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/KeyValueStore.hpp"
#include "protocols/ErrorReport.hpp"

namespace crashwatch::core {

  /**
 * @class DuplicateFilter
 * @brief Signature → last-reported time, with opportunistic compaction.
 *
 * * `isDuplicate()` fails open: a store fault never drops a real report.
 * * Expired entries are purged when the map is first loaded in a run and
 *   whenever a write pushes it past `maxTracked`; the hard cap always holds
 *   after a write.
 * * The loaded map is memoised until `beginRun()`; no cross-request guarantee.
 */
  class DuplicateFilter {
  public:
    struct Options {
      std::int64_t ttlSeconds{ 604800 };
      std::size_t maxTracked{ 1000 };
      std::string versionTag;
    };

    DuplicateFilter(std::shared_ptr<DedupStore> store, std::shared_ptr<Clock> clock,
                    std::shared_ptr<ErrorMonitor> monitor, Options options);

    bool isDuplicate(const protocols::ErrorReport& report);
    bool markReported(const protocols::ErrorReport& report);

    bool clearAll();
    std::size_t count();

    /// Drop the memoised map so the next call re-reads the store.
    void beginRun() { cache_.reset(); }

    std::string signatureOf(const protocols::ErrorReport& report) const;

  private:
    TrackedErrors& tracked(); ///< load (and compact) on first use in a run
    void dropExpired(TrackedErrors& entries, std::int64_t now);
    void evictOldest(TrackedErrors& entries, std::size_t keep);

    std::shared_ptr<DedupStore> store_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<ErrorMonitor> monitor_;
    Options options_;
    std::optional<TrackedErrors> cache_;
  };

} // namespace crashwatch::core
