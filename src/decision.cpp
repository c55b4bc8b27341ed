#include "decision.hpp"
#include "util.hpp"
#include <cmath>
#include <iomanip>

#include <spdlog/spdlog.h>

namespace mdv {

ThresholdDecider::ThresholdDecider(double z_entry, double qty, const std::string& csv_path)
  : z_entry_(z_entry), qty_(qty) {
  if (csv_path.empty()) return;
  out_.open(csv_path);
  if (out_.is_open()) {
    out_ << "ts,id,symbol,side,qty,price,vwap,z,tick_ratio,depth_ratio,bid_vol,ask_vol\n";
  } else {
    spdlog::warn("[Decision] cannot open {}, decisions will not be logged", csv_path);
  }
}

Decision ThresholdDecider::evaluate(double price, double vwap, double std_dev, double depth_ratio) const {
  Decision dec{};
  if (std_dev <= 0) return dec;
  dec.z = (price - vwap) / std_dev;
  if (dec.z <= -z_entry_ && depth_ratio >= 0) { dec.side = +1; dec.qty = qty_; }
  else if (dec.z >= +z_entry_ && depth_ratio <= 0) { dec.side = -1; dec.qty = qty_; }
  return dec;
}

void ThresholdDecider::attempt_decision(const std::string& symbol, double price, double vwap, double std_dev,
                                        double tick_ratio, double depth_ratio, double bid_vol, double ask_vol) {
  Decision d = evaluate(price, vwap, std_dev, depth_ratio);
  std::lock_guard<std::mutex> lk(m_);
  ++attempts_;
  if (d.side == 0) return;
  uint64_t seq = entries_ + 1;
  d.id = fnv1a64_update(fnv1a64_str(symbol), &seq, sizeof(seq));
  d.id = fnv1a64_update(d.id, &d.side, sizeof(d.side));
  entries_ = seq;
  spdlog::debug("[Decision] {} side={} px={} z={:.3f} id={:x}", symbol, d.side, price, d.z, d.id);
  if (!out_.is_open()) return;
  out_ << wall_ns() << "," << d.id << "," << symbol << "," << d.side << "," << std::fixed << std::setprecision(6) << d.qty << ","
       << price << "," << vwap << "," << d.z << "," << tick_ratio << "," << depth_ratio << "," << bid_vol << ","
       << ask_vol << "\n";
}

uint64_t ThresholdDecider::attempts() const {
  std::lock_guard<std::mutex> lk(m_);
  return attempts_;
}

uint64_t ThresholdDecider::entries() const {
  std::lock_guard<std::mutex> lk(m_);
  return entries_;
}

} // namespace mdv
