#include "PrimeGlyph/exec/WorkerPool.hpp"

#include <algorithm>

namespace PrimeGlyph {

WorkerPool::WorkerPool(uint32_t threadCount) {
  uint32_t count = std::max(1u, threadCount);
  workers.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    workers.emplace_back([this]() { worker_loop(); });
  }
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    stopping = true;
    shutdown = true;
  }
  cv.notify_all();
  for (auto& t : workers) {
    if (t.joinable()) t.join();
  }
}

void WorkerPool::start(uint32_t count, std::function<void(uint32_t)> fn) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    job = std::move(fn);
    workCount = count;
    nextWork = 0;
    stopping = false;
  }
  cv.notify_all();
}

void WorkerPool::wait() {
  std::unique_lock<std::mutex> lock(mutex);
  cvDone.wait(lock, [&]() { return idle(); });
}

void WorkerPool::run(uint32_t count, std::function<void(uint32_t)> fn) {
  if (count == 0) return;
  start(count, std::move(fn));
  wait();
}

void WorkerPool::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    stopping = true;
  }
  cvDone.notify_all();
}

bool WorkerPool::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex);
  return stopping;
}

bool WorkerPool::idle() const {
  return running == 0 && (stopping || nextWork >= workCount);
}

void WorkerPool::worker_loop() {
  std::unique_lock<std::mutex> lock(mutex);
  for (;;) {
    cv.wait(lock, [&]() { return shutdown || (!stopping && nextWork < workCount); });
    if (shutdown) return;
    uint32_t idx = nextWork++;
    ++running;
    lock.unlock();
    job(idx);
    lock.lock();
    --running;
    if (idle()) cvDone.notify_all();
  }
}

} // namespace PrimeGlyph
