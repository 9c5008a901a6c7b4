#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace PrimeGlyph {

// Unbounded multi-producer, single-consumer queue. pop() blocks until a value
// arrives or the channel is closed and drained.
template <class T>
class ResultChannel {
public:
  // Returns false once the channel is closed; the value is dropped.
  bool push(T value) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (closed) return false;
      items.push_back(std::move(value));
    }
    cv.notify_one();
    return true;
  }

  auto pop() -> std::optional<T> {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [&]() { return closed || !items.empty(); });
    if (items.empty()) return std::nullopt;
    T value = std::move(items.front());
    items.pop_front();
    return value;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      closed = true;
    }
    cv.notify_all();
  }

  bool isClosed() const {
    std::lock_guard<std::mutex> lock(mutex);
    return closed;
  }

private:
  mutable std::mutex mutex;
  std::condition_variable cv;
  std::deque<T> items;
  bool closed = false;
};

} // namespace PrimeGlyph
