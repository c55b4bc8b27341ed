#include <catch2/catch.hpp>
#include "decision.hpp"
#include "test_util.hpp"
#include <fstream>
#include <set>
#include <string>

using namespace mdv;

TEST_CASE("Threshold decider enters against the z-score when the book agrees", "[decision]") {
  ThresholdDecider d(2.0, 1.0, "");
  // 2.5 std below vwap, bids heavier: buy
  auto buy = d.evaluate(95.0, 100.0, 2.0, 0.3);
  REQUIRE(buy.side == +1);
  REQUIRE(buy.qty == 1.0);
  REQUIRE(buy.z == -2.5);
  // same price but asks heavier: hold
  REQUIRE(d.evaluate(95.0, 100.0, 2.0, -0.3).side == 0);
  REQUIRE(d.evaluate(105.0, 100.0, 2.0, -0.1).side == -1);
  REQUIRE(d.evaluate(101.0, 100.0, 2.0, 0.0).side == 0);
  REQUIRE(d.evaluate(50.0, 100.0, 0.0, 1.0).side == 0);
}

TEST_CASE("Accepted decisions get distinct ids and a CSV line each", "[decision]") {
  std::string csv = fresh_dir("decisions") + "/decisions.csv";
  {
    ThresholdDecider d(1.0, 0.5, csv);
    d.attempt_decision("BTCUSDT", 95.0, 100.0, 2.0, -0.2, 0.4, 10, 4);
    d.attempt_decision("BTCUSDT", 100.0, 100.0, 2.0, 0.0, 0.0, 5, 5);
    d.attempt_decision("ETHUSDT", 110.0, 100.0, 2.0, 0.6, -0.5, 2, 6);
    REQUIRE(d.attempts() == 3);
    REQUIRE(d.entries() == 2);
  }
  std::ifstream f(csv);
  std::string header, l1, l2, extra;
  REQUIRE(std::getline(f, header));
  REQUIRE(header.rfind("ts,id,symbol,side", 0) == 0);
  REQUIRE(std::getline(f, l1));
  REQUIRE(std::getline(f, l2));
  REQUIRE_FALSE(std::getline(f, extra));
  REQUIRE(l1.find(",BTCUSDT,1,") != std::string::npos);
  REQUIRE(l2.find(",ETHUSDT,-1,") != std::string::npos);
  auto id_of = [](const std::string& line) {
    auto a = line.find(',');
    return line.substr(a + 1, line.find(',', a + 1) - a - 1);
  };
  REQUIRE(id_of(l1) != id_of(l2));
}

TEST_CASE("Repeated identical signals each become an entry with its own id", "[decision]") {
  std::string csv = fresh_dir("decisions_repeat") + "/decisions.csv";
  const int n = 1000;
  {
    ThresholdDecider d(1.0, 1.0, csv);
    for (int i = 0; i < n; ++i) d.attempt_decision("BTCUSDT", 95.0, 100.0, 2.0, 0.0, 0.4, 10, 4);
    REQUIRE(d.attempts() == uint64_t(n));
    REQUIRE(d.entries() == uint64_t(n));
  }
  std::ifstream f(csv);
  std::string line;
  REQUIRE(std::getline(f, line));
  std::set<std::string> ids;
  int rows = 0;
  while (std::getline(f, line)) {
    auto a = line.find(',');
    ids.insert(line.substr(a + 1, line.find(',', a + 1) - a - 1));
    ++rows;
  }
  REQUIRE(rows == n);
  REQUIRE(ids.size() == size_t(n));
}
