#pragma once
#include <cstdint>
#include <string>
#include <utility>

namespace mdv {

// Timestamps are nanoseconds since the Unix epoch.

struct Trade {
  std::string symbol;
  double price = 0;
  double qty = 0;
  int64_t ts_ns = 0;
  int64_t seq = 0; // feed sequence number
};

// Aggregated order-book volumes
struct Depth {
  std::string symbol;
  double bid_vol = 0;
  double ask_vol = 0;
  double last_price = 0;
  int64_t ts_ns = 0;
  int64_t seq = 0;
};

// Derived observation produced by the depth path
struct FeatureRecord {
  std::string symbol;
  int64_t ts_ns = 0;
  double tick_ratio = 0;
  double depth_ratio = 0;
  double price_dist = 0; // (price - vwap) / std_dev
  double price = 0;
  double vwap = 0;
  double std_dev = 0;
  double bid_vol = 0;
  double ask_vol = 0;
};

// Lighter record kept for labeling
struct PriceRecord {
  std::string symbol;
  int64_t ts_ns = 0;
  double price = 0;
  double vwap = 0;
  double std_dev = 0;
};

inline bool operator==(const Trade& a, const Trade& b) {
  return a.symbol == b.symbol && a.price == b.price && a.qty == b.qty && a.ts_ns == b.ts_ns && a.seq == b.seq;
}
inline bool operator==(const Depth& a, const Depth& b) {
  return a.symbol == b.symbol && a.bid_vol == b.bid_vol && a.ask_vol == b.ask_vol &&
         a.last_price == b.last_price && a.ts_ns == b.ts_ns && a.seq == b.seq;
}
inline bool operator==(const FeatureRecord& a, const FeatureRecord& b) {
  return a.symbol == b.symbol && a.ts_ns == b.ts_ns && a.tick_ratio == b.tick_ratio &&
         a.depth_ratio == b.depth_ratio && a.price_dist == b.price_dist && a.price == b.price &&
         a.vwap == b.vwap && a.std_dev == b.std_dev && a.bid_vol == b.bid_vol && a.ask_vol == b.ask_vol;
}
inline bool operator==(const PriceRecord& a, const PriceRecord& b) {
  return a.symbol == b.symbol && a.ts_ns == b.ts_ns && a.price == b.price && a.vwap == b.vwap &&
         a.std_dev == b.std_dev;
}

// Result of a fallible operation; message is set when !ok
struct Status {
  bool ok = true;
  std::string message;

  static Status success() { return Status{}; }
  static Status error(std::string msg) { Status s; s.ok = false; s.message = std::move(msg); return s; }
  explicit operator bool() const { return ok; }
};

} // namespace mdv
