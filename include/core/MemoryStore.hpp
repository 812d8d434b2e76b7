#pragma once
/** @file  MemoryStore.hpp
 *  @brief Thread-safe in-process implementations of the dedup and counter stores.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <mutex>
#include <unordered_map>

#include "core/Clock.hpp"
#include "core/KeyValueStore.hpp"

namespace crashwatch {
  namespace core {

    /** @class MemoryDedupStore
 *  @brief Lock-protected <signature → unix time> map.
 *
 *  * Shared by every reporter in the process; state dies with the process.
 *  * Expiry is the DuplicateFilter's business, the store keeps what it is given.
 */
    class MemoryDedupStore : public DedupStore {

    public:
      MemoryDedupStore() = default;
      ~MemoryDedupStore() override = default;

      std::optional<std::int64_t> get(const std::string& signature) override;
      void set(const std::string& signature, std::int64_t timestamp) override;
      void erase(const std::string& signature) override;
      TrackedErrors getAll() override;
      void deleteAll() override;

    private:
      mutable std::mutex mtx_;
      TrackedErrors tracked_;
    };

    /** @class MemoryCounterStore
 *  @brief Lock-protected counters with lazy TTL expiry.
 *
 *  * Expired counters are dropped when next touched, never by a sweep.
 */
    class MemoryCounterStore : public RateCounterStore {

    public:
      explicit MemoryCounterStore(std::shared_ptr<Clock> clock);
      ~MemoryCounterStore() override = default;

      int get(const std::string& key) override;
      void set(const std::string& key, int value, std::int64_t ttlSeconds) override;
      void erase(const std::string& key) override;
      std::int64_t getExpiry(const std::string& key) override;

    private:
      struct Counter {
        int value{ 0 };
        std::int64_t expiresAt{ 0 };
      };

      /// Returns the live counter for \p key or nullptr, erasing it if lapsed. Caller holds mtx_.
      Counter* findLive(const std::string& key);

      std::shared_ptr<Clock> clock_;
      mutable std::mutex mtx_;
      std::unordered_map<std::string, Counter> counters_;
    };

  } // namespace core
} // namespace crashwatch
