#include <catch2/catch.hpp>
#include "codec.hpp"
#include <limits>
#include <nlohmann/json.hpp>

using namespace mdv;

TEST_CASE("Records encode as field-named JSON objects", "[codec]") {
  std::string s;
  REQUIRE(encode(Trade{"BTCUSDT", 50000.5, 0.25, 1700000000000000001LL, 9}, s).ok);
  auto j = nlohmann::json::parse(s);
  REQUIRE(j.at("symbol") == "BTCUSDT");
  REQUIRE(j.at("price") == 50000.5);
  REQUIRE(j.at("ts") == 1700000000000000001LL);

  FeatureRecord f;
  f.symbol = "ETHUSDT"; f.ts_ns = 5; f.price_dist = -1.25;
  REQUIRE(encode(f, s).ok);
  j = nlohmann::json::parse(s);
  REQUIRE(j.at("timestamp") == 5);
  REQUIRE(j.at("price_dist") == -1.25);
  REQUIRE(j.contains("tick_ratio"));
  REQUIRE(j.contains("ask_vol"));
}

TEST_CASE("Non-finite values do not encode", "[codec]") {
  std::string s;
  PriceRecord p{"BTCUSDT", 1, std::numeric_limits<double>::quiet_NaN(), 1.0, 1.0};
  REQUIRE_FALSE(encode(p, s).ok);
  Depth d{"BTCUSDT", 1.0, std::numeric_limits<double>::infinity(), 1.0, 1, 1};
  REQUIRE_FALSE(encode(d, s).ok);
}

TEST_CASE("Decode rejects malformed payloads", "[codec]") {
  Trade t;
  REQUIRE_FALSE(decode("", t));
  REQUIRE_FALSE(decode("{\"symbol\":", t));
  REQUIRE_FALSE(decode("[1,2,3]", t));
  REQUIRE_FALSE(decode("{\"symbol\":\"X\",\"price\":\"high\",\"qty\":1,\"ts\":1}", t));
  REQUIRE_FALSE(decode("{\"symbol\":\"X\",\"qty\":1,\"ts\":1}", t));
  // seq is optional for records written without one
  REQUIRE(decode("{\"symbol\":\"X\",\"price\":2.5,\"qty\":1,\"ts\":7}", t));
  REQUIRE(t.price == 2.5);
  REQUIRE(t.ts_ns == 7);
  REQUIRE(t.seq == 0);
}
