#pragma once
#include "events.hpp"

namespace mdv {

// Persistence seen from the pipeline. A disabled store is a NullSink, so
// write sites never branch on whether persistence is available.
class EventSink {
public:
  virtual ~EventSink() = default;
  virtual Status store_trade(const Trade& t) = 0;
  virtual Status store_depth(const Depth& d) = 0;
  virtual Status store_features(const FeatureRecord& f) = 0;
  virtual Status store_price(const PriceRecord& p) = 0;
  virtual bool enabled() const { return true; }
};

class NullSink : public EventSink {
public:
  Status store_trade(const Trade&) override { return Status::success(); }
  Status store_depth(const Depth&) override { return Status::success(); }
  Status store_features(const FeatureRecord&) override { return Status::success(); }
  Status store_price(const PriceRecord&) override { return Status::success(); }
  bool enabled() const override { return false; }
};

} // namespace mdv
