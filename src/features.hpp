#pragma once
#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mdv {

struct VwapResult {
  double vwap = 0;
  double std_dev = 0; // volume-weighted dispersion around vwap
  int samples = 0;    // samples inside the time window
};

// Rolling volume-weighted average price, bounded by sample count and age.
// Written by the trade task, read by the depth task.
class Vwap {
public:
  Vwap(int64_t window_ns, size_t max_samples);

  // Rejects non-finite or negative inputs; returns false when rejected
  bool add(double price, double qty);
  bool add_at(double price, double qty, int64_t now_ns);

  VwapResult calc() const;
  VwapResult calc_at(int64_t now_ns) const;

  size_t size() const;
  void reset();

private:
  struct Sample { double p; double v; int64_t t; };
  int64_t window_ns_;
  size_t max_samples_;
  std::deque<Sample> samples_;
  mutable std::mutex m_;
};

// Rolling window of signed trade directions (+1 / -1 / 0)
class TickImbalance {
public:
  explicit TickImbalance(size_t max_ticks);
  void add(int sign);
  double ratio() const; // mean of signs, 0 when empty
  int last() const;     // most recent sign, 0 when empty
  size_t size() const;

private:
  size_t max_;
  std::deque<int8_t> buf_;
  int sum_ = 0;
  mutable std::mutex m_;
};

// Normalized bid/ask volume difference in [-1, 1]; 0 when both sides are empty
double depth_imbalance(double bid_vol, double ask_vol);

// Last observed trade price per symbol. The symbol set is fixed at
// construction so lookups never lock; each slot is an independent atomic.
class LastPriceTable {
public:
  explicit LastPriceTable(const std::vector<std::string>& symbols);
  // false if the symbol is not configured
  bool load(const std::string& symbol, double& out) const;
  bool store(const std::string& symbol, double price);
  // Stores `price` and returns the previous value (0 before the first trade)
  bool exchange(const std::string& symbol, double price, double& previous);

private:
  std::unordered_map<std::string, std::unique_ptr<std::atomic<double>>> slots_;
};

struct SymbolFeatures {
  SymbolFeatures(int64_t vwap_window_ns, size_t vwap_size, size_t tick_size)
      : vwap(vwap_window_ns, vwap_size), ticks(tick_size) {}
  Vwap vwap;
  TickImbalance ticks;
};

struct FeatureParams {
  int64_t vwap_window_ns = 30LL * 1000000000LL;
  size_t vwap_size = 600;
  size_t tick_size = 50;
};

// All per-symbol state, created once at startup
class FeatureState {
public:
  FeatureState(const std::vector<std::string>& symbols, const FeatureParams& params);
  SymbolFeatures* find(const std::string& symbol);
  const std::vector<std::string>& symbols() const { return symbols_; }
  LastPriceTable& last_prices() { return last_prices_; }
  const LastPriceTable& last_prices() const { return last_prices_; }

private:
  std::vector<std::string> symbols_;
  std::unordered_map<std::string, std::unique_ptr<SymbolFeatures>> per_symbol_;
  LastPriceTable last_prices_;
};

} // namespace mdv
