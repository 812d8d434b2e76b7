#pragma once
/** @file  KeyValueStore.hpp
 *  @brief Storage seams consumed by the duplicate filter and the rate limiter.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace crashwatch::core {

  /// Thrown by store implementations when the backing store is unreachable.
  class StorageError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /// signature -> last-reported unix time
  using TrackedErrors = std::unordered_map<std::string, std::int64_t>;

  /**
 * @class DedupStore
 * @brief Persistent map of error signatures to the time they were last reported.
 *
 *  * Implementations may throw StorageError from any call.
 */
  class DedupStore {
  public:
    virtual ~DedupStore() = default;

    virtual std::optional<std::int64_t> get(const std::string& signature) = 0;
    virtual void set(const std::string& signature, std::int64_t timestamp) = 0;
    virtual void erase(const std::string& signature) = 0;
    virtual TrackedErrors getAll() = 0;
    virtual void deleteAll() = 0;
  };

  /**
 * @class RateCounterStore
 * @brief Integer counters that expire on their own after a TTL.
 *
 *  * `get()` returns 0 for absent or expired keys.
 *  * `getExpiry()` returns the unix time the key expires, 0 if absent.
 *  * Implementations may throw StorageError from any call.
 */
  class RateCounterStore {
  public:
    virtual ~RateCounterStore() = default;

    virtual int get(const std::string& key) = 0;
    virtual void set(const std::string& key, int value, std::int64_t ttlSeconds) = 0;
    virtual void erase(const std::string& key) = 0;
    virtual std::int64_t getExpiry(const std::string& key) = 0;
  };

} // namespace crashwatch::core
