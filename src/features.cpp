#include "features.hpp"
#include "util.hpp"
#include <cmath>

namespace mdv {

Vwap::Vwap(int64_t window_ns, size_t max_samples)
  : window_ns_(window_ns > 0 ? window_ns : 60LL * kNsPerSec), max_samples_(max_samples > 0 ? max_samples : 1) {}

bool Vwap::add(double price, double qty) { return add_at(price, qty, (int64_t)to_ns(steady_clock::now())); }

bool Vwap::add_at(double price, double qty, int64_t now_ns) {
  if (!std::isfinite(price) || price < 0) return false;
  if (!std::isfinite(qty) || qty < 0) return false;
  std::lock_guard<std::mutex> lk(m_);
  if (samples_.size() == max_samples_) samples_.pop_front();
  samples_.push_back(Sample{price, qty, now_ns});
  return true;
}

VwapResult Vwap::calc() const { return calc_at((int64_t)to_ns(steady_clock::now())); }

VwapResult Vwap::calc_at(int64_t now_ns) const {
  VwapResult r{};
  std::lock_guard<std::mutex> lk(m_);
  const int64_t cutoff = now_ns - window_ns_;
  double pv = 0, vv = 0;
  for (const auto& s : samples_) {
    if (s.t <= cutoff) continue;
    pv += s.p * s.v;
    vv += s.v;
    r.samples++;
  }
  if (r.samples == 0 || vv == 0) return r;
  r.vwap = pv / vv;
  if (r.samples == 1) return r;

  double wvar = 0;
  for (const auto& s : samples_) {
    if (s.t <= cutoff) continue;
    double d = s.p - r.vwap;
    wvar += s.v * d * d;
  }
  double var = wvar / vv;
  // negative only through rounding
  r.std_dev = var > 0 ? std::sqrt(var) : 0.0;
  if (!std::isfinite(r.vwap)) { r.vwap = 0; r.std_dev = 0; }
  if (!std::isfinite(r.std_dev)) r.std_dev = 0;
  return r;
}

size_t Vwap::size() const {
  std::lock_guard<std::mutex> lk(m_);
  return samples_.size();
}

void Vwap::reset() {
  std::lock_guard<std::mutex> lk(m_);
  samples_.clear();
}

TickImbalance::TickImbalance(size_t max_ticks) : max_(max_ticks > 0 ? max_ticks : 1) {}

void TickImbalance::add(int sign) {
  int8_t s = sign > 0 ? 1 : (sign < 0 ? -1 : 0);
  std::lock_guard<std::mutex> lk(m_);
  if (buf_.size() == max_) {
    sum_ -= buf_.front();
    buf_.pop_front();
  }
  buf_.push_back(s);
  sum_ += s;
}

double TickImbalance::ratio() const {
  std::lock_guard<std::mutex> lk(m_);
  if (buf_.empty()) return 0.0;
  return double(sum_) / double(buf_.size());
}

int TickImbalance::last() const {
  std::lock_guard<std::mutex> lk(m_);
  return buf_.empty() ? 0 : buf_.back();
}

size_t TickImbalance::size() const {
  std::lock_guard<std::mutex> lk(m_);
  return buf_.size();
}

double depth_imbalance(double bid_vol, double ask_vol) {
  double total = bid_vol + ask_vol;
  if (total == 0) return 0.0;
  return (bid_vol - ask_vol) / total;
}

LastPriceTable::LastPriceTable(const std::vector<std::string>& symbols) {
  for (const auto& s : symbols) slots_.emplace(s, std::make_unique<std::atomic<double>>(0.0));
}

bool LastPriceTable::load(const std::string& symbol, double& out) const {
  auto it = slots_.find(symbol);
  if (it == slots_.end()) return false;
  out = it->second->load(std::memory_order_acquire);
  return true;
}

bool LastPriceTable::store(const std::string& symbol, double price) {
  auto it = slots_.find(symbol);
  if (it == slots_.end()) return false;
  it->second->store(price, std::memory_order_release);
  return true;
}

bool LastPriceTable::exchange(const std::string& symbol, double price, double& previous) {
  auto it = slots_.find(symbol);
  if (it == slots_.end()) return false;
  previous = it->second->exchange(price, std::memory_order_acq_rel);
  return true;
}

FeatureState::FeatureState(const std::vector<std::string>& symbols, const FeatureParams& params)
  : symbols_(symbols), last_prices_(symbols) {
  for (const auto& s : symbols) {
    per_symbol_.emplace(s, std::make_unique<SymbolFeatures>(params.vwap_window_ns, params.vwap_size, params.tick_size));
  }
}

SymbolFeatures* FeatureState::find(const std::string& symbol) {
  auto it = per_symbol_.find(symbol);
  return it == per_symbol_.end() ? nullptr : it->second.get();
}

} // namespace mdv
