#include "pipeline.hpp"

#include <spdlog/spdlog.h>

namespace mdv {

Pipeline::Pipeline(FeatureState& state, EventSink& sink, DecisionSink& decisions, MetricsSink& metrics)
  : state_(state), sink_(sink), decisions_(decisions), metrics_(metrics) {}

void Pipeline::process_trades(std::vector<Trade>& batch) {
  for (const auto& t : batch) on_trade(t);
}

void Pipeline::process_depths(std::vector<Depth>& batch) {
  for (const auto& d : batch) on_depth(d);
}

void Pipeline::persist(const Status& st, const char* what) {
  if (st) return;
  metrics_.inc(Counter::StoreErrors);
  spdlog::warn("[Pipeline] store {} failed: {}", what, st.message);
}

void Pipeline::on_trade(const Trade& t) {
  SymbolFeatures* sf = state_.find(t.symbol);
  if (!sf) {
    metrics_.inc(Counter::UnknownSymbol);
    return;
  }
  metrics_.inc(Counter::TradesReceived);
  if (!sf->vwap.add(t.price, t.qty)) {
    // rejected input must not reach the last-price cell
    metrics_.inc(Counter::FeatureErrors);
    return;
  }

  // previous value is read and replaced in one step
  double prev = 0;
  state_.last_prices().exchange(t.symbol, t.price, prev);
  int sign = 0;
  if (t.price > prev) sign = 1;
  else if (t.price < prev) sign = -1;
  sf->ticks.add(sign);

  persist(sink_.store_trade(t), "trade");
  samples_.fetch_add(1, std::memory_order_relaxed);
}

void Pipeline::on_depth(const Depth& d) {
  SymbolFeatures* sf = state_.find(d.symbol);
  if (!sf) {
    metrics_.inc(Counter::UnknownSymbol);
    return;
  }

  double price = 0;
  state_.last_prices().load(d.symbol, price);
  // no trade yet, or no dispersion to measure against: warm-up, not an error
  if (price != 0) {
    VwapResult v = sf->vwap.calc();
    if (v.std_dev != 0) {
      metrics_.inc(Counter::VwapCalculations);
      const double tick_ratio = sf->ticks.ratio();
      const double depth_ratio = depth_imbalance(d.bid_vol, d.ask_vol);
      decisions_.attempt_decision(d.symbol, price, v.vwap, v.std_dev, tick_ratio, depth_ratio, d.bid_vol, d.ask_vol);
      metrics_.inc(Counter::DecisionsDispatched);

      FeatureRecord fr;
      fr.symbol = d.symbol;
      fr.ts_ns = d.ts_ns;
      fr.tick_ratio = tick_ratio;
      fr.depth_ratio = depth_ratio;
      fr.price_dist = (price - v.vwap) / v.std_dev;
      fr.price = price;
      fr.vwap = v.vwap;
      fr.std_dev = v.std_dev;
      fr.bid_vol = d.bid_vol;
      fr.ask_vol = d.ask_vol;
      persist(sink_.store_features(fr), "features");
      persist(sink_.store_price(PriceRecord{d.symbol, d.ts_ns, price, v.vwap, v.std_dev}), "price");
    }
  }

  persist(sink_.store_depth(d), "depth");
  metrics_.inc(Counter::DepthsReceived);
  samples_.fetch_add(1, std::memory_order_relaxed);
}

} // namespace mdv
