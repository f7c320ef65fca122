#ifndef __GRAPH_TOOLS_LRU_CACHE_HH__
#define __GRAPH_TOOLS_LRU_CACHE_HH__

#include "spdlog/spdlog.h"
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace graph_tools {

// Statistics about cache usage since construction or the last Clear()
struct CacheStats {
  uint64_t hits{0};
  uint64_t misses{0};
  uint64_t evictions{0};
  size_t size{0};
  size_t capacity{0};
  friend std::ostream &operator<<(std::ostream &os, const CacheStats &stats) {
    os << "Cache: " << stats.size << "/" << stats.capacity << " entries, "
       << stats.hits << " hits, " << stats.misses << " misses, "
       << stats.evictions << " evictions";
    return os;
  }
};

/**
 * @brief Bounded least-recently-used cache
 *
 * @details Get and Put both mark the entry as most recently used. Inserting
 * into a full cache evicts the least recently used entry. All operations
 * lock an internal mutex, so one cache may be shared between threads.
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache {
public:
  explicit LruCache(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
      throw std::invalid_argument("Cache capacity must be positive");
    }
  }

  // Non-copyable
  LruCache(const LruCache &) = delete;
  LruCache &operator=(const LruCache &) = delete;

  std::optional<Value> Get(const Key &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
      stats_.misses++;
      return std::nullopt;
    }
    stats_.hits++;
    entries_.splice(entries_.begin(), entries_, it->second);
    return it->second->second;
  }

  void Put(const Key &key, Value value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = index_.find(key); it != index_.end()) {
      it->second->second = std::move(value);
      entries_.splice(entries_.begin(), entries_, it->second);
      return;
    }

    entries_.emplace_front(key, std::move(value));
    index_.emplace(key, entries_.begin());

    if (entries_.size() > capacity_) {
      index_.erase(entries_.back().first);
      entries_.pop_back();
      stats_.evictions++;
      spdlog::trace("Evicted least recently used cache entry");
    }
  }

  bool Contains(const Key &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.find(key) != index_.end();
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

  size_t Capacity() const { return capacity_; }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
    stats_ = CacheStats();
  }

  CacheStats GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats = stats_;
    stats.size = entries_.size();
    stats.capacity = capacity_;
    return stats;
  }

private:
  using Entry = std::pair<Key, Value>;

  const size_t capacity_;
  std::list<Entry> entries_; // most recently used first
  std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> index_;
  CacheStats stats_;
  mutable std::mutex mutex_;
};

} // namespace graph_tools

#endif
