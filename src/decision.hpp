#pragma once
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace mdv {

// Hand-off to the decision subsystem, once per depth observation with a
// usable signal. Outcomes stay on the decision side.
class DecisionSink {
public:
  virtual ~DecisionSink() = default;
  virtual void attempt_decision(const std::string& symbol, double price, double vwap, double std_dev,
                                double tick_ratio, double depth_ratio, double bid_vol, double ask_vol) = 0;
};

struct Decision {
  // -1 sell, 0 hold, +1 buy
  int side = 0;
  uint64_t id = 0;
  double qty = 0;
  double z = 0; // price distance from vwap in std devs
};

// Mean-reversion entry on the price/vwap z-score, confirmed by book imbalance.
// Accepted decisions get an id derived from (symbol, entry sequence, side).
// The tick ratio is logged with a decision but does not gate it.
class ThresholdDecider : public DecisionSink {
public:
  ThresholdDecider(double z_entry, double qty, const std::string& csv_path);

  void attempt_decision(const std::string& symbol, double price, double vwap, double std_dev,
                        double tick_ratio, double depth_ratio, double bid_vol, double ask_vol) override;

  Decision evaluate(double price, double vwap, double std_dev, double depth_ratio) const;

  uint64_t attempts() const;
  uint64_t entries() const;

private:
  double z_entry_;
  double qty_;
  std::ofstream out_;
  uint64_t attempts_ = 0;
  uint64_t entries_ = 0;
  mutable std::mutex m_;
};

} // namespace mdv
