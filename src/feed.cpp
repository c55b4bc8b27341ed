#include "feed.hpp"
#include "util.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

#include <spdlog/spdlog.h>

namespace mdv {

double rate_with_bursts(int base_rate, double t, const std::vector<Burst>& bursts) {
  double r = base_rate;
  for (auto& b : bursts) {
    if (t >= b.t_s && t < (b.t_s + b.dur_s)) r *= b.x;
  }
  return r;
}

SimFeed::SimFeed(SimFeedOptions opts) : opts_(std::move(opts)), rng_(opts_.seed) {
  if (opts_.depth_every < 1) opts_.depth_every = 1;
}

void SimFeed::stream(const Context& ctx, const std::vector<std::string>& symbols, Channel<Trade>& trades,
                     Channel<Depth>& depths, Channel<std::string>& errors) {
  using namespace std::chrono;
  if (symbols.empty()) return;
  const size_t S = symbols.size();
  std::vector<double> mids(S);
  std::vector<uint64_t> trade_n(S, 0);
  for (size_t i=0;i<S;++i) mids[i] = 100.0 + double(i); // simple ladder of prices

  std::uniform_real_distribution<double> walk(-0.001, 0.001);
  std::uniform_real_distribution<double> qty(0.01, 1.0);
  std::uniform_real_distribution<double> vol(1.0, 100.0);

  spdlog::info("[Feed] simulated feed started: symbols={} rate={} seed={}", S, opts_.rate, opts_.seed);
  auto start = steady_clock::now();
  auto next = start;
  int64_t seq = 0;
  size_t sym = 0;
  while (!ctx.cancelled()) {
    double t = duration<double>(next - start).count();
    double r = rate_with_bursts(opts_.rate, t, opts_.bursts);
    auto period = nanoseconds((int64_t)(1e9 / std::max(1.0, r)));

    double& mid = mids[sym];
    mid = std::max(0.01, mid * (1.0 + walk(rng_)));
    Trade tr{symbols[sym], mid, qty(rng_), wall_ns(), ++seq};
    if (!trades.push(std::move(tr))) break;
    ++produced_;

    if (++trade_n[sym] % (uint64_t)opts_.depth_every == 0) {
      Depth d{symbols[sym], vol(rng_), vol(rng_), mid, wall_ns(), ++seq};
      if (!depths.push(std::move(d))) break;
      ++produced_;
    }

    if (opts_.fault_every > 0 && produced_ % (uint64_t)opts_.fault_every == 0) {
      // error reporting must never stall the data path
      if (errors.try_push("simulated stream fault at seq " + std::to_string(seq))) ++faults_;
    }
    if (opts_.max_events && produced_ >= opts_.max_events) break;

    sym = (sym + 1) % S;
    next += period;
    auto wait = next - steady_clock::now();
    if (wait.count() > 0 && ctx.wait_for(wait)) break;
  }
  spdlog::info("[Feed] simulated feed stopped: produced={} faults={}", produced_, faults_);
}

} // namespace mdv
