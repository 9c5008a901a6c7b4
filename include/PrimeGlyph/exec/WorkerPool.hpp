#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace PrimeGlyph {

// Fixed set of threads working through indexed tasks [0, count). One task
// set runs at a time; start() must not be called again before wait() returns.
class WorkerPool {
public:
  explicit WorkerPool(uint32_t threadCount);
  ~WorkerPool();

  WorkerPool(WorkerPool const&) = delete;
  WorkerPool& operator=(WorkerPool const&) = delete;

  // Returns immediately; tasks run on the pool threads.
  void start(uint32_t count, std::function<void(uint32_t)> fn);
  // Blocks until every claimed task has finished and nothing is left to claim.
  void wait();
  void run(uint32_t count, std::function<void(uint32_t)> fn);
  // Stops handing out new indices. Tasks already running finish normally.
  void cancel();

  bool cancelled() const;
  auto threadCount() const -> uint32_t { return static_cast<uint32_t>(workers.size()); }

private:
  void worker_loop();
  bool idle() const;

  mutable std::mutex mutex;
  std::condition_variable cv;
  std::condition_variable cvDone;
  bool shutdown = false;
  bool stopping = false;
  uint32_t workCount = 0;
  uint32_t nextWork = 0;
  uint32_t running = 0;
  std::function<void(uint32_t)> job;
  std::vector<std::thread> workers;
};

} // namespace PrimeGlyph
