#include "metrics.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <cmath>

#include <nlohmann/json.hpp>

#ifdef __linux__
#include <unistd.h>
#include <cstdio>
#endif

namespace mdv {

LatencyRecorder::LatencyRecorder(double max_ms, int bins, size_t sample_cap)
  : max_ms_(max_ms), bins_(bins), hist_(bins, 0), sample_cap_(sample_cap) {}

void LatencyRecorder::add_sample(double ms) {
  if (ms < 0) ms = 0;
  int idx = (int)std::min((double)(bins_-1), std::floor(ms / max_ms_ * bins_));
  std::lock_guard<std::mutex> lk(m_);
  hist_[idx]++;
  if (samples_.size() < sample_cap_) samples_.push_back(ms);
  if (ms > max_observed_) max_observed_ = ms;
}

uint64_t LatencyRecorder::count() const {
  std::lock_guard<std::mutex> lk(m_);
  uint64_t total = 0; for (auto c : hist_) total += c;
  return total;
}

Percentiles LatencyRecorder::percentiles() const {
  std::lock_guard<std::mutex> lk(m_);
  Percentiles p{};
  uint64_t total = 0; for (auto c : hist_) total += c;
  if (total == 0) { p.jitter_ratio = 0; return p; }
  auto kth = [&](double q){
    uint64_t k = (uint64_t)std::ceil(q * total);
    uint64_t acc = 0;
    for (int i=0;i<bins_;++i) { acc += hist_[i]; if (acc >= k) return (i+0.5)*(max_ms_/bins_); }
    return max_ms_;
  };
  p.p50 = kth(0.50);
  p.p95 = kth(0.95);
  p.p99 = kth(0.99);
  p.max = std::max(max_observed_, p.p99);
  p.jitter_ratio = (p.p50 > 0) ? (p.p99 / p.p50) : 0.0;
  return p;
}

std::string LatencyRecorder::csv_samples() const {
  std::lock_guard<std::mutex> lk(m_);
  std::ostringstream oss;
  for (size_t i=0;i<samples_.size();++i) {
    oss << std::fixed << std::setprecision(6) << samples_[i] << "\n";
  }
  return oss.str();
}

const char* counter_name(Counter c) {
  switch (c) {
    case Counter::TradesReceived: return "trades_received_total";
    case Counter::DepthsReceived: return "depths_received_total";
    case Counter::VwapCalculations: return "vwap_calculations_total";
    case Counter::DecisionsDispatched: return "decisions_dispatched_total";
    case Counter::FeatureErrors: return "feature_errors_total";
    case Counter::StoreErrors: return "store_errors_total";
    case Counter::WsReconnects: return "ws_reconnects_total";
    case Counter::ErrorsTotal: return "errors_total";
    case Counter::TradeBatches: return "trade_batches_total";
    case Counter::DepthBatches: return "depth_batches_total";
    case Counter::UnknownSymbol: return "unknown_symbol_total";
    case Counter::TaskFailures: return "task_failures_total";
    case Counter::kCount: break;
  }
  return "unknown";
}

std::string Metrics::to_json(const RunInfo& info) const {
  using nlohmann::json;
  auto p = flush_latency_.percentiles();
  json counters = json::object();
  for (size_t i = 0; i < (size_t)Counter::kCount; ++i) counters[counter_name((Counter)i)] = get((Counter)i);

  json j;
  j["version"] = "1";
  j["fingerprint"] = {{"code_hash", info.code_hash}, {"symbols", info.symbols}, {"seed", info.seed},
                      {"rate", info.rate}, {"persistence", info.persistence}};
  j["counters"] = counters;
  j["flush_latency_ms"] = {{"p50", p.p50}, {"p95", p.p95}, {"p99", p.p99}, {"max", p.max},
                           {"jitter_ratio", p.jitter_ratio}, {"flushes", flush_latency_.count()}};
  uint64_t events = get(Counter::TradesReceived) + get(Counter::DepthsReceived);
  j["throughput"] = {{"eps", events / std::max(1e-9, info.elapsed_s)}, {"elapsed_s", info.elapsed_s}};
  j["queues"] = {{"trade_depth_max", trade_queue_max}, {"depth_depth_max", depth_queue_max}};
  j["resources"] = {{"rss_mb", rss_mb()}};
  return j.dump(2);
}

double rss_mb() {
#ifdef __linux__
  // Read /proc/self/statm: size resident shared text lib data dt
  FILE* f = std::fopen("/proc/self/statm", "r");
  if (!f) return 0.0;
  long pages = 0, resident = 0;
  if (std::fscanf(f, "%ld %ld", &pages, &resident) != 2) { std::fclose(f); return 0.0; }
  std::fclose(f);
  long page_size = sysconf(_SC_PAGESIZE);
  return (double)resident * (double)page_size / (1024.0 * 1024.0);
#else
  return 0.0;
#endif
}

} // namespace mdv
