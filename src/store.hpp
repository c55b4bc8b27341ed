#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "events.hpp"
#include "kvdb.hpp"
#include "sink.hpp"

namespace mdv {

// Bucket names, one per record kind
constexpr const char* kTradesBucket = "trades";
constexpr const char* kDepthsBucket = "depths";
constexpr const char* kFeaturesBucket = "features";
constexpr const char* kPricesBucket = "prices";

// "<symbol>_<ts>" with ts as 19 zero-padded decimal digits, so byte order is
// time order within a symbol. Negative timestamps are clamped to 0.
std::string series_key(const std::string& symbol, int64_t ts_ns);

// Time-series persistence on top of KvDb. Each put is its own transaction;
// scans run in a read transaction and skip records that fail to decode.
class Store : public EventSink {
public:
  static constexpr const char* kFileName = "mdvault.db";

  struct Options {
    bool read_only = false;
    bool sync = true;
    int lock_timeout_ms = 1000;
  };

  // nullptr when the directory or database cannot be opened; `st` says why
  static std::unique_ptr<Store> open(const std::string& data_dir, const Options& opts, Status& st);

  // Encodes the record inside the write transaction; an encode failure aborts it
  Status store_trade(const Trade& t) override;
  Status store_depth(const Depth& d) override;
  Status store_features(const FeatureRecord& f) override;
  Status store_price(const PriceRecord& p) override;

  // Inclusive of both bounds
  Status get_trades(const std::string& symbol, int64_t start_ns, int64_t end_ns, std::vector<Trade>& out) const;
  Status get_depths(const std::string& symbol, int64_t start_ns, int64_t end_ns, std::vector<Depth>& out) const;
  Status get_prices(const std::string& symbol, int64_t start_ns, int64_t end_ns, std::vector<PriceRecord>& out) const;
  // Exclusive of both bounds: start < ts < end
  Status get_features_in_range(const std::string& symbol, int64_t start_ns, int64_t end_ns,
                               std::vector<FeatureRecord>& out) const;

  // Every decodable feature record, bucket order (symbol, then time)
  Status for_each_feature(const std::function<void(const FeatureRecord&)>& fn) const;

  std::map<std::string, size_t> bucket_counts() const { return db_->bucket_counts(); }
  uint64_t malformed_skipped() const;
  Status compact() { return db_->compact(); }
  Status close() { return db_->close(); }
  const std::string& path() const { return db_->path(); }
  KvDb& db() { return *db_; }

private:
  explicit Store(std::unique_ptr<KvDb> db) : db_(std::move(db)) {}

  template <typename Rec>
  Status put_record(const char* bucket, const Rec& rec, const std::string& symbol, int64_t ts_ns);

  template <typename Rec>
  Status scan(const char* bucket, const std::string& symbol, int64_t start_ns, int64_t end_ns,
              std::vector<Rec>& out) const;

  std::unique_ptr<KvDb> db_;
  mutable std::atomic<uint64_t> malformed_{0};
};

} // namespace mdv
