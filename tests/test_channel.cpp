#include <catch2/catch.hpp>
#include "channel.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using mdv::Channel;
using mdv::RecvStatus;
using namespace std::chrono;

TEST_CASE("Channel keeps order and loses nothing under backpressure", "[channel]") {
  struct P { int v; };
  Channel<P> ch(64);
  const int N = 100000; // keep CI fast
  std::atomic<int> consumed{0};
  std::atomic<int> rejected{0};
  std::thread prod([&]{
    for (int i=0;i<N;++i) if (!ch.push(P{i})) rejected++;
    ch.close();
  });
  int expected = 0;
  bool ordered = true;
  P out{};
  while (ch.pop_for(out, seconds(5)) == RecvStatus::Item) {
    if (out.v != expected) ordered = false;
    expected++;
    consumed++;
  }
  prod.join();
  REQUIRE(rejected.load() == 0);
  REQUIRE(ordered);
  REQUIRE(consumed.load() == N);
  REQUIRE(ch.max_depth() > 0);
  REQUIRE(ch.max_depth() <= ch.capacity());
}

TEST_CASE("Channel capacity rounds up to a power of two", "[channel]") {
  Channel<int> ch(50);
  REQUIRE(ch.capacity() == 64);
  for (int i=0;i<64;++i) REQUIRE(ch.try_push(i));
  REQUIRE_FALSE(ch.try_push(64));
  REQUIRE(ch.depth() == 64);
}

TEST_CASE("Channel pop times out when empty", "[channel]") {
  Channel<int> ch(4);
  int v = 0;
  auto t0 = steady_clock::now();
  REQUIRE(ch.pop_for(v, milliseconds(20)) == RecvStatus::Timeout);
  REQUIRE(steady_clock::now() - t0 >= milliseconds(15));
  REQUIRE_FALSE(ch.try_pop(v));
}

TEST_CASE("Closed channel drains before reporting Closed", "[channel]") {
  Channel<std::string> ch(4);
  REQUIRE(ch.push("a"));
  REQUIRE(ch.push("b"));
  ch.close();
  REQUIRE(ch.closed());
  REQUIRE_FALSE(ch.push("c"));
  std::string s;
  REQUIRE(ch.pop_for(s, milliseconds(10)) == RecvStatus::Item);
  REQUIRE(s == "a");
  REQUIRE(ch.pop_for(s, milliseconds(10)) == RecvStatus::Item);
  REQUIRE(s == "b");
  REQUIRE(ch.pop_for(s, milliseconds(10)) == RecvStatus::Closed);
}

TEST_CASE("Close wakes a producer blocked on a full channel", "[channel]") {
  Channel<int> ch(1);
  REQUIRE(ch.push(1));
  std::atomic<bool> result{true};
  std::thread prod([&]{ result = ch.push(2); });
  std::this_thread::sleep_for(milliseconds(20));
  ch.close();
  prod.join();
  REQUIRE_FALSE(result.load());
}
