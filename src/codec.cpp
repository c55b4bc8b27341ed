#include "codec.hpp"
#include <cmath>
#include <initializer_list>

#include <nlohmann/json.hpp>

namespace mdv {

using nlohmann::json;

namespace {

bool all_finite(std::initializer_list<double> vals) {
  for (double v : vals) if (!std::isfinite(v)) return false;
  return true;
}

Status dump_into(const json& j, std::string& out) {
  try {
    out = j.dump();
  } catch (const json::exception& e) {
    return Status::error(std::string("marshal: ") + e.what());
  }
  return Status::success();
}

// Parses and hands the object to `fill`; any missing field or type mismatch is malformed.
template <typename Fill>
bool parse_object(const std::string& data, Fill fill) {
  json j = json::parse(data, nullptr, /*allow_exceptions=*/false);
  if (!j.is_object()) return false;
  try {
    fill(j);
  } catch (const json::exception&) {
    return false;
  }
  return true;
}

} // namespace

Status encode(const Trade& t, std::string& out) {
  if (!all_finite({t.price, t.qty})) return Status::error("marshal trade: non-finite value");
  json j = {{"symbol", t.symbol}, {"price", t.price}, {"qty", t.qty}, {"ts", t.ts_ns}, {"seq", t.seq}};
  return dump_into(j, out);
}

Status encode(const Depth& d, std::string& out) {
  if (!all_finite({d.bid_vol, d.ask_vol, d.last_price})) return Status::error("marshal depth: non-finite value");
  json j = {{"symbol", d.symbol}, {"bid_vol", d.bid_vol}, {"ask_vol", d.ask_vol},
            {"last_price", d.last_price}, {"ts", d.ts_ns}, {"seq", d.seq}};
  return dump_into(j, out);
}

Status encode(const FeatureRecord& f, std::string& out) {
  if (!all_finite({f.tick_ratio, f.depth_ratio, f.price_dist, f.price, f.vwap, f.std_dev, f.bid_vol, f.ask_vol}))
    return Status::error("marshal feature record: non-finite value");
  json j = {{"symbol", f.symbol},         {"timestamp", f.ts_ns}, {"tick_ratio", f.tick_ratio},
            {"depth_ratio", f.depth_ratio}, {"price_dist", f.price_dist}, {"price", f.price},
            {"vwap", f.vwap},             {"std_dev", f.std_dev}, {"bid_vol", f.bid_vol},
            {"ask_vol", f.ask_vol}};
  return dump_into(j, out);
}

Status encode(const PriceRecord& p, std::string& out) {
  if (!all_finite({p.price, p.vwap, p.std_dev})) return Status::error("marshal price record: non-finite value");
  json j = {{"symbol", p.symbol}, {"timestamp", p.ts_ns}, {"price", p.price}, {"vwap", p.vwap}, {"std_dev", p.std_dev}};
  return dump_into(j, out);
}

bool decode(const std::string& data, Trade& out) {
  return parse_object(data, [&](const json& j) {
    out.symbol = j.at("symbol").get<std::string>();
    out.price = j.at("price").get<double>();
    out.qty = j.at("qty").get<double>();
    out.ts_ns = j.at("ts").get<int64_t>();
    out.seq = j.value("seq", int64_t{0});
  });
}

bool decode(const std::string& data, Depth& out) {
  return parse_object(data, [&](const json& j) {
    out.symbol = j.at("symbol").get<std::string>();
    out.bid_vol = j.at("bid_vol").get<double>();
    out.ask_vol = j.at("ask_vol").get<double>();
    out.last_price = j.at("last_price").get<double>();
    out.ts_ns = j.at("ts").get<int64_t>();
    out.seq = j.value("seq", int64_t{0});
  });
}

bool decode(const std::string& data, FeatureRecord& out) {
  return parse_object(data, [&](const json& j) {
    out.symbol = j.at("symbol").get<std::string>();
    out.ts_ns = j.at("timestamp").get<int64_t>();
    out.tick_ratio = j.at("tick_ratio").get<double>();
    out.depth_ratio = j.at("depth_ratio").get<double>();
    out.price_dist = j.at("price_dist").get<double>();
    out.price = j.at("price").get<double>();
    out.vwap = j.at("vwap").get<double>();
    out.std_dev = j.at("std_dev").get<double>();
    out.bid_vol = j.at("bid_vol").get<double>();
    out.ask_vol = j.at("ask_vol").get<double>();
  });
}

bool decode(const std::string& data, PriceRecord& out) {
  return parse_object(data, [&](const json& j) {
    out.symbol = j.at("symbol").get<std::string>();
    out.ts_ns = j.at("timestamp").get<int64_t>();
    out.price = j.at("price").get<double>();
    out.vwap = j.at("vwap").get<double>();
    out.std_dev = j.at("std_dev").get<double>();
  });
}

} // namespace mdv
