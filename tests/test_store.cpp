#include <catch2/catch.hpp>
#include "codec.hpp"
#include "store.hpp"
#include "test_util.hpp"
#include "util.hpp"
#include <atomic>
#include <cstdint>
#include <fstream>
#include <limits>
#include <thread>
#include <vector>

using namespace mdv;

static std::unique_ptr<Store> open_store(const std::string& dir, bool read_only = false) {
  Store::Options opts;
  opts.sync = false;
  opts.read_only = read_only;
  Status st;
  auto s = Store::open(dir, opts, st);
  INFO(st.message);
  REQUIRE(s);
  return s;
}

static FeatureRecord feature(const std::string& sym, int64_t ts) {
  FeatureRecord f;
  f.symbol = sym; f.ts_ns = ts;
  f.tick_ratio = 0.2; f.depth_ratio = -0.1; f.price_dist = 1.5;
  f.price = 101.0; f.vwap = 100.0; f.std_dev = 0.5;
  f.bid_vol = 10; f.ask_vol = 12;
  return f;
}

TEST_CASE("Series keys sort by time within a symbol", "[store]") {
  REQUIRE(series_key("BTCUSDT", 42) == "BTCUSDT_0000000000000000042");
  REQUIRE(series_key("BTCUSDT", -5) == series_key("BTCUSDT", 0));
  REQUIRE(series_key("X", 9) < series_key("X", 10));
  REQUIRE(series_key("X", 999999999) < series_key("X", 1000000000));
}

TEST_CASE("Trade range scan is inclusive and ordered", "[store]") {
  auto store = open_store(fresh_dir("store_trades"));
  const int64_t T = 1700000000LL * kNsPerSec;
  REQUIRE(store->store_trade(Trade{"BTCUSDT", 50010.0, 0.2, T + kNsPerSec, 2}).ok);
  REQUIRE(store->store_trade(Trade{"BTCUSDT", 50000.0, 0.1, T, 1}).ok);
  REQUIRE(store->store_trade(Trade{"BTCUSDT", 49990.0, 0.3, T + 10 * kNsPerSec, 3}).ok);

  std::vector<Trade> out;
  REQUIRE(store->get_trades("BTCUSDT", T - kNsPerSec, T + 5 * kNsPerSec, out).ok);
  REQUIRE(out.size() == 2);
  REQUIRE(out[0].price == 50000.0);
  REQUIRE(out[1].price == 50010.0);

  // both bounds inclusive
  REQUIRE(store->get_trades("BTCUSDT", T, T + 10 * kNsPerSec, out).ok);
  REQUIRE(out.size() == 3);
  REQUIRE(out[2] == Trade{"BTCUSDT", 49990.0, 0.3, T + 10 * kNsPerSec, 3});

  REQUIRE(store->get_trades("BTCUSDT", T + 5, T, out).ok);
  REQUIRE(out.empty());
}

TEST_CASE("Scanning a never-written bucket is empty, not an error", "[store]") {
  auto store = open_store(fresh_dir("store_empty"));
  std::vector<Depth> depths;
  std::vector<FeatureRecord> feats;
  std::vector<PriceRecord> prices;
  REQUIRE(store->get_depths("BTCUSDT", 0, INT64_MAX, depths).ok);
  REQUIRE(store->get_features_in_range("BTCUSDT", 0, INT64_MAX, feats).ok);
  REQUIRE(store->get_prices("BTCUSDT", 0, INT64_MAX, prices).ok);
  REQUIRE(depths.empty());
  REQUIRE(feats.empty());
  REQUIRE(prices.empty());
}

TEST_CASE("Feature range scan excludes both bounds", "[store]") {
  auto store = open_store(fresh_dir("store_features"));
  for (int64_t ts : {100, 200, 300, 400}) REQUIRE(store->store_features(feature("ETHUSDT", ts)).ok);
  std::vector<FeatureRecord> out;
  REQUIRE(store->get_features_in_range("ETHUSDT", 100, 400, out).ok);
  REQUIRE(out.size() == 2);
  REQUIRE(out[0].ts_ns == 200);
  REQUIRE(out[1].ts_ns == 300);
  REQUIRE(out[0] == feature("ETHUSDT", 200));
}

TEST_CASE("Scans ignore other symbols, including prefix-sharing ones", "[store]") {
  auto store = open_store(fresh_dir("store_interleave"));
  for (int i=0;i<20;++i) {
    REQUIRE(store->store_trade(Trade{"ETH", 1.0 + i, 1, 1000 + i, i}).ok);
    REQUIRE(store->store_trade(Trade{"ETHUSDT", 2.0 + i, 1, 1000 + i, i}).ok);
    REQUIRE(store->store_trade(Trade{"BTC", 3.0 + i, 1, 1000 + i, i}).ok);
  }
  std::vector<Trade> out;
  REQUIRE(store->get_trades("ETH", 0, INT64_MAX, out).ok);
  REQUIRE(out.size() == 20);
  for (size_t i=0;i<out.size();++i) {
    REQUIRE(out[i].symbol == "ETH");
    REQUIRE(out[i].ts_ns == 1000 + (int64_t)i);
  }
  REQUIRE(store->get_trades("ETHUSDT", 1005, 1009, out).ok);
  REQUIRE(out.size() == 5);
}

TEST_CASE("Every record kind reads back equal after reopen", "[store]") {
  std::string dir = fresh_dir("store_roundtrip");
  Trade t{"BTCUSDT", 50000.5, 0.125, 1700000000123456789LL, 7};
  Depth d{"BTCUSDT", 12.5, 8.25, 50000.5, 1700000000123456790LL, 8};
  FeatureRecord f = feature("BTCUSDT", 1700000000123456791LL);
  PriceRecord p{"BTCUSDT", 1700000000123456792LL, 50000.5, 49990.0, 3.5};
  {
    auto store = open_store(dir);
    REQUIRE(store->store_trade(t).ok);
    REQUIRE(store->store_depth(d).ok);
    REQUIRE(store->store_features(f).ok);
    REQUIRE(store->store_price(p).ok);
    REQUIRE(store->close().ok);
  }
  auto store = open_store(dir, /*read_only=*/true);
  std::vector<Trade> ts; std::vector<Depth> ds; std::vector<FeatureRecord> fs; std::vector<PriceRecord> ps;
  REQUIRE(store->get_trades("BTCUSDT", 0, INT64_MAX, ts).ok);
  REQUIRE(store->get_depths("BTCUSDT", 0, INT64_MAX, ds).ok);
  REQUIRE(store->get_features_in_range("BTCUSDT", 0, INT64_MAX, fs).ok);
  REQUIRE(store->get_prices("BTCUSDT", 0, INT64_MAX, ps).ok);
  REQUIRE(ts == std::vector<Trade>{t});
  REQUIRE(ds == std::vector<Depth>{d});
  REQUIRE(fs == std::vector<FeatureRecord>{f});
  REQUIRE(ps == std::vector<PriceRecord>{p});
  auto counts = store->bucket_counts();
  REQUIRE(counts[kTradesBucket] == 1);
  REQUIRE(counts[kPricesBucket] == 1);
  REQUIRE_FALSE(store->store_trade(t).ok); // read-only
}

TEST_CASE("Concurrent writers and readers lose and corrupt nothing", "[store]") {
  auto store = open_store(fresh_dir("store_concurrent"));
  const int W = 5, N = 10;
  std::atomic<int> write_errors{0}, read_errors{0}, bad_records{0};
  std::vector<std::thread> threads;
  for (int w=0;w<W;++w) {
    threads.emplace_back([&, w]{
      for (int i=0;i<N;++i) {
        Trade t{"BTCUSDT", 100.0 + w, 1.0 + i, int64_t(w) * 1000 + i, i};
        if (!store->store_trade(t).ok) write_errors++;
      }
    });
    threads.emplace_back([&]{
      std::vector<Trade> out;
      for (int i=0;i<N;++i) {
        if (!store->get_trades("BTCUSDT", 0, INT64_MAX, out).ok) read_errors++;
        for (size_t k=1;k<out.size();++k) if (out[k].ts_ns <= out[k-1].ts_ns) bad_records++;
        for (auto& t : out) if (t.symbol != "BTCUSDT" || t.price != 100.0 + double(t.ts_ns / 1000)) bad_records++;
      }
    });
  }
  for (auto& th : threads) th.join();
  REQUIRE(write_errors.load() == 0);
  REQUIRE(read_errors.load() == 0);
  REQUIRE(bad_records.load() == 0);
  std::vector<Trade> all;
  REQUIRE(store->get_trades("BTCUSDT", 0, INT64_MAX, all).ok);
  REQUIRE(all.size() == size_t(W * N));
  REQUIRE(store->malformed_skipped() == 0);
}

TEST_CASE("Malformed stored records are skipped by scans", "[store]") {
  auto store = open_store(fresh_dir("store_malformed"));
  REQUIRE(store->store_trade(Trade{"BTCUSDT", 1.0, 1.0, 10, 1}).ok);
  REQUIRE(store->store_trade(Trade{"BTCUSDT", 3.0, 1.0, 30, 3}).ok);
  REQUIRE(store->db().update([](WriteTxn& tx) {
    Status st = tx.put(kTradesBucket, series_key("BTCUSDT", 20), "{not json");
    if (!st) return st;
    return tx.put(kTradesBucket, series_key("BTCUSDT", 25), "{\"symbol\":\"BTCUSDT\"}");
  }).ok);
  std::vector<Trade> out;
  REQUIRE(store->get_trades("BTCUSDT", 0, 100, out).ok);
  REQUIRE(out.size() == 2);
  REQUIRE(out[0].ts_ns == 10);
  REQUIRE(out[1].ts_ns == 30);
  REQUIRE(store->malformed_skipped() == 2);
}

TEST_CASE("Records that cannot be encoded are rejected", "[store]") {
  auto store = open_store(fresh_dir("store_nonfinite"));
  FeatureRecord f = feature("BTCUSDT", 5);
  f.price_dist = std::numeric_limits<double>::infinity();
  REQUIRE_FALSE(store->store_features(f).ok);
  std::vector<FeatureRecord> out;
  REQUIRE(store->get_features_in_range("BTCUSDT", 0, 10, out).ok);
  REQUIRE(out.empty());
}

TEST_CASE("Feature export walks every symbol in key order", "[store]") {
  auto store = open_store(fresh_dir("store_export"));
  REQUIRE(store->store_features(feature("ETHUSDT", 2)).ok);
  REQUIRE(store->store_features(feature("BTCUSDT", 3)).ok);
  REQUIRE(store->store_features(feature("BTCUSDT", 1)).ok);
  std::vector<std::string> seen;
  REQUIRE(store->for_each_feature([&](const FeatureRecord& f) {
    seen.push_back(f.symbol + "@" + std::to_string(f.ts_ns));
  }).ok);
  REQUIRE(seen == std::vector<std::string>{"BTCUSDT@1", "BTCUSDT@3", "ETHUSDT@2"});
}

TEST_CASE("Opening a store under a regular file fails", "[store]") {
  std::string dir = fresh_dir("store_badpath");
  std::string file = dir + "/not_a_dir";
  std::ofstream(file) << "x";
  Store::Options opts;
  Status st;
  auto store = Store::open(file, opts, st);
  REQUIRE_FALSE(store);
  REQUIRE_FALSE(st.ok);
}
