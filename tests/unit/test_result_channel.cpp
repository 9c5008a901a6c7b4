#include "PrimeGlyph/exec/ResultChannel.hpp"

#include <doctest/doctest.h>

#include <thread>
#include <vector>

using namespace PrimeGlyph;

TEST_SUITE_BEGIN("primeglyph.exec");

TEST_CASE("drains_then_ends") {
  ResultChannel<int> channel;
  CHECK(channel.push(1));
  CHECK(channel.push(2));
  channel.close();
  CHECK_FALSE(channel.push(3));
  CHECK(channel.pop() == 1);
  CHECK(channel.pop() == 2);
  CHECK_FALSE(channel.pop().has_value());
  CHECK(channel.isClosed());
}

TEST_CASE("consumer_waits_for_producers") {
  ResultChannel<int> channel;
  std::vector<std::thread> producers;
  for (int p = 0; p < 4; ++p) {
    producers.emplace_back([&, p]() {
      for (int i = 0; i < 50; ++i) channel.push(p * 100 + i);
    });
  }
  std::thread closer([&]() {
    for (auto& t : producers) t.join();
    channel.close();
  });

  int received = 0;
  while (channel.pop()) ++received;
  closer.join();
  CHECK(received == 200);
}

TEST_SUITE_END();
