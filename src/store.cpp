#include "store.hpp"
#include "codec.hpp"

#include <cinttypes>
#include <cstdio>
#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

namespace mdv {

namespace {

constexpr size_t kTsDigits = 19;

// "<prefix><19 digits>" only; guards against symbols that share a prefix
bool is_series_key(const std::string& key, const std::string& prefix) {
  if (key.size() != prefix.size() + kTsDigits) return false;
  if (key.compare(0, prefix.size(), prefix) != 0) return false;
  for (size_t i = prefix.size(); i < key.size(); ++i)
    if (key[i] < '0' || key[i] > '9') return false;
  return true;
}

} // namespace

std::string series_key(const std::string& symbol, int64_t ts_ns) {
  char digits[32];
  std::snprintf(digits, sizeof(digits), "%019" PRId64, ts_ns < 0 ? int64_t{0} : ts_ns);
  return symbol + "_" + digits;
}

std::unique_ptr<Store> Store::open(const std::string& data_dir, const Options& opts, Status& st) {
  namespace fs = std::filesystem;
  if (!opts.read_only) {
    std::error_code ec;
    fs::create_directories(data_dir, ec);
    if (ec) {
      st = Status::error("create data dir " + data_dir + ": " + ec.message());
      return nullptr;
    }
  }
  KvOptions kv;
  kv.read_only = opts.read_only;
  kv.sync = opts.sync;
  kv.lock_timeout_ms = opts.lock_timeout_ms;
  auto db = KvDb::open((fs::path(data_dir) / kFileName).string(), kv, st);
  if (!db) {
    st = Status::error("failed to open database: " + st.message);
    return nullptr;
  }
  spdlog::info("[Store] opened {} ({} bytes{})", db->path(), db->file_size(), opts.read_only ? ", read-only" : "");
  return std::unique_ptr<Store>(new Store(std::move(db)));
}

template <typename Rec>
Status Store::put_record(const char* bucket, const Rec& rec, const std::string& symbol, int64_t ts_ns) {
  const std::string key = series_key(symbol, ts_ns);
  return db_->update([&](WriteTxn& tx) {
    Status st = tx.create_bucket_if_not_exists(bucket);
    if (!st) return Status::error(std::string("create ") + bucket + " bucket: " + st.message);
    std::string payload;
    st = encode(rec, payload);
    if (!st) return st;
    return tx.put(bucket, key, payload);
  });
}

Status Store::store_trade(const Trade& t) { return put_record(kTradesBucket, t, t.symbol, t.ts_ns); }
Status Store::store_depth(const Depth& d) { return put_record(kDepthsBucket, d, d.symbol, d.ts_ns); }
Status Store::store_features(const FeatureRecord& f) { return put_record(kFeaturesBucket, f, f.symbol, f.ts_ns); }
Status Store::store_price(const PriceRecord& p) { return put_record(kPricesBucket, p, p.symbol, p.ts_ns); }

template <typename Rec>
Status Store::scan(const char* bucket, const std::string& symbol, int64_t start_ns, int64_t end_ns,
                   std::vector<Rec>& out) const {
  out.clear();
  if (end_ns < start_ns) return Status::success();
  const std::string prefix = symbol + "_";
  const std::string start_key = series_key(symbol, start_ns);
  const std::string end_key = series_key(symbol, end_ns);

  return db_->view([&](const ReadTxn& tx) {
    const KvBucket* b = tx.bucket(bucket);
    if (!b) return Status::success(); // nothing written yet
    Cursor c(tx, *b);
    std::string val;
    for (bool more = c.seek(start_key); more && c.key() <= end_key; more = c.next()) {
      if (!is_series_key(c.key(), prefix)) continue;
      Status st = c.value(val);
      if (!st) return st;
      Rec rec;
      if (!decode(val, rec)) {
        malformed_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("[Store] skipping malformed record {}/{}", bucket, c.key());
        continue;
      }
      out.push_back(std::move(rec));
    }
    return Status::success();
  });
}

Status Store::get_trades(const std::string& symbol, int64_t start_ns, int64_t end_ns, std::vector<Trade>& out) const {
  return scan(kTradesBucket, symbol, start_ns, end_ns, out);
}

Status Store::get_depths(const std::string& symbol, int64_t start_ns, int64_t end_ns, std::vector<Depth>& out) const {
  return scan(kDepthsBucket, symbol, start_ns, end_ns, out);
}

Status Store::get_prices(const std::string& symbol, int64_t start_ns, int64_t end_ns,
                         std::vector<PriceRecord>& out) const {
  return scan(kPricesBucket, symbol, start_ns, end_ns, out);
}

Status Store::get_features_in_range(const std::string& symbol, int64_t start_ns, int64_t end_ns,
                                    std::vector<FeatureRecord>& out) const {
  std::vector<FeatureRecord> all;
  Status st = scan(kFeaturesBucket, symbol, start_ns, end_ns, all);
  out.clear();
  if (!st) return st;
  for (auto& f : all) {
    if (f.ts_ns > start_ns && f.ts_ns < end_ns) out.push_back(std::move(f));
  }
  return st;
}

Status Store::for_each_feature(const std::function<void(const FeatureRecord&)>& fn) const {
  return db_->view([&](const ReadTxn& tx) {
    const KvBucket* b = tx.bucket(kFeaturesBucket);
    if (!b) return Status::success();
    Cursor c(tx, *b);
    std::string val;
    for (bool more = c.first(); more; more = c.next()) {
      Status st = c.value(val);
      if (!st) return st;
      FeatureRecord f;
      if (!decode(val, f)) {
        malformed_.fetch_add(1, std::memory_order_relaxed);
        continue;
      }
      fn(f);
    }
    return Status::success();
  });
}

uint64_t Store::malformed_skipped() const { return malformed_.load(std::memory_order_relaxed); }

} // namespace mdv
