#pragma once
#include <atomic>
#include <cstdint>
#include <vector>

#include "decision.hpp"
#include "events.hpp"
#include "features.hpp"
#include "metrics.hpp"
#include "sink.hpp"

namespace mdv {

// Per-event processing behind the two batch accumulators. process_trades()
// runs on the trade task and process_depths() on the depth task; the
// last-price table is the only state both sides touch.
class Pipeline {
public:
  Pipeline(FeatureState& state, EventSink& sink, DecisionSink& decisions, MetricsSink& metrics);

  void process_trades(std::vector<Trade>& batch);
  void process_depths(std::vector<Depth>& batch);

  // Trade path: feed vwap and tick state, then publish the new last price
  void on_trade(const Trade& t);
  // Depth path: derive features against the latest trade state and dispatch
  void on_depth(const Depth& d);

  uint64_t samples() const { return samples_.load(std::memory_order_relaxed); }

private:
  void persist(const Status& st, const char* what);

  FeatureState& state_;
  EventSink& sink_;
  DecisionSink& decisions_;
  MetricsSink& metrics_;
  std::atomic<uint64_t> samples_{0};
};

} // namespace mdv
