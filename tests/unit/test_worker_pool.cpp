#include "PrimeGlyph/exec/WorkerPool.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace PrimeGlyph;

TEST_SUITE_BEGIN("primeglyph.exec");

TEST_CASE("runs_every_index_once") {
  WorkerPool pool(4);
  CHECK(pool.threadCount() == 4u);
  std::vector<std::atomic<int>> hits(257);
  pool.run(257, [&](uint32_t index) { hits[index].fetch_add(1); });
  for (auto const& h : hits) CHECK(h.load() == 1);

  pool.run(3, [&](uint32_t index) { hits[index].fetch_add(1); });
  CHECK_MESSAGE(hits[0].load() == 2, "pool is reusable");
  CHECK(hits[3].load() == 1);
}

TEST_CASE("zero_threads_still_works") {
  WorkerPool pool(0);
  CHECK(pool.threadCount() == 1u);
  std::atomic<int> count{0};
  pool.run(5, [&](uint32_t) { count.fetch_add(1); });
  CHECK(count.load() == 5);
}

TEST_CASE("cancel_stops_new_work") {
  WorkerPool pool(2);
  std::atomic<int> started{0};
  pool.start(100, [&](uint32_t) {
    started.fetch_add(1);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  });
  while (started.load() == 0) std::this_thread::yield();
  pool.cancel();
  pool.wait();
  CHECK(pool.cancelled());
  int afterCancel = started.load();
  CHECK(afterCancel < 100);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  CHECK_MESSAGE(started.load() == afterCancel, "nothing starts after cancel");
}

TEST_SUITE_END();
