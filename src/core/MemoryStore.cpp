/* @file MemoryStore.cpp
 * @brief in-process dedup map and TTL counters.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>

// CrashWatch headers
#include "core/MemoryStore.hpp"

using namespace crashwatch::core;

//---MemoryDedupStore----------------------------------------------------

std::optional<std::int64_t> MemoryDedupStore::get(const std::string& signature) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = tracked_.find(signature);
  if (it == tracked_.end())
    return std::nullopt;
  return it->second;
}

void MemoryDedupStore::set(const std::string& signature, std::int64_t timestamp) {
  std::lock_guard<std::mutex> lock(mtx_);
  tracked_[signature] = timestamp;
}

void MemoryDedupStore::erase(const std::string& signature) {
  std::lock_guard<std::mutex> lock(mtx_);
  tracked_.erase(signature);
}

TrackedErrors MemoryDedupStore::getAll() {
  std::lock_guard<std::mutex> lock(mtx_);
  return tracked_;
}

void MemoryDedupStore::deleteAll() {
  std::lock_guard<std::mutex> lock(mtx_);
  tracked_.clear();
}

//---MemoryCounterStore--------------------------------------------------

MemoryCounterStore::MemoryCounterStore(std::shared_ptr<Clock> clock) : clock_(std::move(clock)) {
  assert(clock_ && "[MemoryCounterStore] clock is nullptr");
}

MemoryCounterStore::Counter* MemoryCounterStore::findLive(const std::string& key) {
  auto it = counters_.find(key);
  if (it == counters_.end())
    return nullptr;
  if (clock_->now() >= it->second.expiresAt) {
    counters_.erase(it);
    return nullptr;
  }
  return &it->second;
}

int MemoryCounterStore::get(const std::string& key) {
  std::lock_guard<std::mutex> lock(mtx_);
  const Counter* c = findLive(key);
  return c ? c->value : 0;
}

void MemoryCounterStore::set(const std::string& key, int value, std::int64_t ttlSeconds) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (ttlSeconds <= 0) {
    counters_.erase(key);
    return;
  }
  counters_[key] = Counter{ value, clock_->now() + ttlSeconds };
}

void MemoryCounterStore::erase(const std::string& key) {
  std::lock_guard<std::mutex> lock(mtx_);
  counters_.erase(key);
}

std::int64_t MemoryCounterStore::getExpiry(const std::string& key) {
  std::lock_guard<std::mutex> lock(mtx_);
  const Counter* c = findLive(key);
  return c ? c->expiresAt : 0;
}
