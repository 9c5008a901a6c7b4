#pragma once

#include "PrimeGlyph/cache/CacheStats.hpp"

#include <exception>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace PrimeGlyph {

// Thread-safe LRU map of shared values with single-flight loading.
//
// getOrLoad() runs the loader at most once per key at a time; concurrent
// callers for a key that is being loaded wait for that load and share its
// outcome. Failed loads are not cached. The cache only holds one reference per
// entry, so evicting an entry never invalidates a value a caller still holds.
// A capacity of 0 disables caching: every lookup runs its own load.
template <class Key, class Value, class Hash = std::hash<Key>>
class LruCache {
public:
  using ValuePtr = std::shared_ptr<Value>;
  using EvictionListener = std::function<void(Key const&)>;

  explicit LruCache(size_t capacity) : maxEntries(capacity) {}

  LruCache(LruCache const&) = delete;
  LruCache& operator=(LruCache const&) = delete;

  // loader: ValuePtr(std::string& error); returns nullptr with error set on
  // failure. Exceptions thrown by the loader reach every waiter of that load.
  template <class Loader>
  auto getOrLoad(Key const& key, Loader&& loader, std::string* error = nullptr) -> ValuePtr {
    std::unique_lock<std::mutex> lock(mutex);
    if (maxEntries == 0) {
      ++missCount;
      lock.unlock();
      return run_loader(loader, error);
    }

    if (auto it = index.find(key); it != index.end()) {
      entries.splice(entries.begin(), entries, it->second);
      ++hitCount;
      return it->second->second;
    }

    if (auto it = inflight.find(key); it != inflight.end()) {
      std::shared_future<Outcome> pending = it->second;
      ++hitCount;
      lock.unlock();
      Outcome const& outcome = pending.get();
      if (!outcome.value && error) *error = outcome.error;
      return outcome.value;
    }

    ++missCount;
    std::promise<Outcome> promise;
    inflight.emplace(key, promise.get_future().share());
    lock.unlock();

    Outcome outcome;
    try {
      outcome.value = loader(outcome.error);
    } catch (...) {
      {
        std::lock_guard<std::mutex> relock(mutex);
        inflight.erase(key);
      }
      promise.set_exception(std::current_exception());
      throw;
    }

    std::vector<Entry> evicted;
    EvictionListener listener;
    lock.lock();
    inflight.erase(key);
    if (outcome.value && maxEntries > 0) {
      insert_front(key, outcome.value);
      evict_to(maxEntries, evicted);
      if (!evicted.empty()) listener = onEvict;
    }
    lock.unlock();

    promise.set_value(outcome);
    notify_evicted(listener, evicted);
    if (!outcome.value && error) *error = outcome.error;
    return outcome.value;
  }

  // Lookup without promotion or stats.
  auto peek(Key const& key) const -> ValuePtr {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = index.find(key);
    if (it == index.end()) return nullptr;
    return it->second->second;
  }

  void setCapacity(size_t capacity) {
    std::vector<Entry> evicted;
    EvictionListener listener;
    {
      std::lock_guard<std::mutex> lock(mutex);
      maxEntries = capacity;
      evict_to(capacity, evicted);
      if (!evicted.empty()) listener = onEvict;
    }
    notify_evicted(listener, evicted);
  }

  auto capacity() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex);
    return maxEntries;
  }

  auto size() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
  }

  void clear() {
    std::list<Entry> dropped;
    {
      std::lock_guard<std::mutex> lock(mutex);
      dropped.swap(entries);
      index.clear();
    }
  }

  auto stats() const -> TierStats {
    std::lock_guard<std::mutex> lock(mutex);
    TierStats out;
    out.capacity = maxEntries;
    out.entries = entries.size();
    out.hits = hitCount;
    out.misses = missCount;
    return out;
  }

  void setEvictionListener(EvictionListener listener) {
    std::lock_guard<std::mutex> lock(mutex);
    onEvict = std::move(listener);
  }

private:
  using Entry = std::pair<Key, ValuePtr>;

  struct Outcome {
    ValuePtr value;
    std::string error;
  };

  template <class Loader>
  static auto run_loader(Loader& loader, std::string* error) -> ValuePtr {
    std::string message;
    ValuePtr value = loader(message);
    if (!value && error) *error = std::move(message);
    return value;
  }

  void insert_front(Key const& key, ValuePtr value) {
    if (auto it = index.find(key); it != index.end()) {
      it->second->second = std::move(value);
      entries.splice(entries.begin(), entries, it->second);
      return;
    }
    entries.emplace_front(key, std::move(value));
    index.emplace(key, entries.begin());
  }

  // Entries are moved out so values are released and listeners run after the
  // lock is dropped.
  void evict_to(size_t limit, std::vector<Entry>& evicted) {
    while (entries.size() > limit) {
      index.erase(entries.back().first);
      evicted.push_back(std::move(entries.back()));
      entries.pop_back();
    }
  }

  static void notify_evicted(EvictionListener const& listener, std::vector<Entry> const& evicted) {
    if (!listener) return;
    for (auto const& entry : evicted) listener(entry.first);
  }

  mutable std::mutex mutex;
  size_t maxEntries = 0;
  std::list<Entry> entries;
  std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> index;
  std::unordered_map<Key, std::shared_future<Outcome>, Hash> inflight;
  uint64_t hitCount = 0;
  uint64_t missCount = 0;
  EvictionListener onEvict;
};

} // namespace PrimeGlyph
