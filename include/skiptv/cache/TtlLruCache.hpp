// Repository: SkipTV
// Component: TTL + LRU cache
// Purpose: Capacity-bounded, thread-safe key/value store with per-entry TTL.
//          Shared by every device session (segment sets, channel ids).
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_CACHE_TTL_LRU_CACHE_HPP_
#define SKIPTV_CACHE_TTL_LRU_CACHE_HPP_

#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

#include "skiptv/timing/ITimeSource.hpp"

namespace skiptv::cache {

// TtlLruCache keeps at most `capacity` entries (0 = unbounded). The front of
// the recency list is most-recently-used; Get() and a refreshing Set() move an
// entry to the front, and overflow evicts from the back.
//
// Entries stored with permanent=false expire `ttl` after insertion (ttl of 0
// disables expiry). An expired entry reads as absent and is erased on the
// Get() that observes it.
//
// Get() reorders the recency list, so every operation takes the one mutex.
template <typename Value>
class TtlLruCache {
 public:
  struct Stats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
  };

  TtlLruCache(std::size_t capacity,
              std::chrono::milliseconds ttl,
              std::shared_ptr<timing::ITimeSource> time_source)
      : capacity_(capacity), ttl_(ttl), time_source_(std::move(time_source)) {
    if (!time_source_) {
      throw std::invalid_argument("TtlLruCache requires a time source");
    }
  }

  TtlLruCache(const TtlLruCache&) = delete;
  TtlLruCache& operator=(const TtlLruCache&) = delete;

  std::optional<Value> Get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
      ++stats_.misses;
      return std::nullopt;
    }
    const Entry& entry = *it->second;
    if (entry.expires_at_us && time_source_->NowMonotonicUs() >= *entry.expires_at_us) {
      lru_.erase(it->second);
      index_.erase(it);
      ++stats_.expirations;
      ++stats_.misses;
      return std::nullopt;
    }
    lru_.splice(lru_.begin(), lru_, it->second);
    ++stats_.hits;
    return it->second->value;
  }

  void Set(const std::string& key, Value value, bool permanent) {
    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t now_us = time_source_->NowMonotonicUs();
    std::optional<int64_t> expires_at_us;
    if (!permanent && ttl_.count() > 0) {
      expires_at_us = now_us +
          std::chrono::duration_cast<std::chrono::microseconds>(ttl_).count();
    }

    auto it = index_.find(key);
    if (it != index_.end()) {
      Entry& entry = *it->second;
      entry.value = std::move(value);
      entry.inserted_at_us = now_us;
      entry.expires_at_us = expires_at_us;
      lru_.splice(lru_.begin(), lru_, it->second);
      return;
    }

    lru_.push_front(Entry{key, std::move(value), now_us, expires_at_us});
    index_[key] = lru_.begin();

    if (capacity_ > 0 && lru_.size() > capacity_) {
      index_.erase(lru_.back().key);
      lru_.pop_back();
      ++stats_.evictions;
    }
  }

  // Returns true if the key was present.
  bool Delete(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) return false;
    lru_.erase(it->second);
    index_.erase(it);
    return true;
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lru_.clear();
    index_.clear();
  }

  // Includes expired entries that have not been observed yet.
  std::size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lru_.size();
  }

  std::size_t Capacity() const { return capacity_; }
  std::chrono::milliseconds Ttl() const { return ttl_; }

  Stats GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
  }

 private:
  struct Entry {
    std::string key;
    Value value;
    int64_t inserted_at_us;
    std::optional<int64_t> expires_at_us;
  };
  using EntryList = std::list<Entry>;

  const std::size_t capacity_;
  const std::chrono::milliseconds ttl_;
  std::shared_ptr<timing::ITimeSource> time_source_;

  mutable std::mutex mutex_;
  EntryList lru_;
  std::unordered_map<std::string, typename EntryList::iterator> index_;
  Stats stats_;
};

}  // namespace skiptv::cache

#endif  // SKIPTV_CACHE_TTL_LRU_CACHE_HPP_
