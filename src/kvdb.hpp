#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "events.hpp"

namespace mdv {

// Embedded ordered key-value store: named buckets of byte-ordered keys,
// serialized write transactions, snapshot read transactions, and durability
// through an append-only transaction log replayed on open.
//
// Log frame: magic u32 | type u8 | bucket_len u32 | key_len u32 | val_len u32 |
//            bucket | key | value | fnv1a64 u64 (over everything after magic).
// Integers are little-endian. A transaction is its operation frames followed by
// a commit frame whose value is the operation count; anything after the last
// valid commit is discarded.
//
// Only keys live in memory. Each key maps to the position of its value in the
// log and values are read back with pread when a transaction asks for them.

class KvDb;

// Where a committed value sits in the log
struct ValueRef {
  uint64_t offset = 0;
  uint32_t size = 0;
};

using KvBucket = std::map<std::string, ValueRef>;

struct KvOptions {
  bool read_only = false;
  bool sync = true;           // fdatasync after every commit
  int lock_timeout_ms = 1000; // wait for the file lock this long before failing
};

class ReadTxn {
public:
  explicit ReadTxn(const KvDb& db) : db_(db) {}
  // nullptr when the bucket was never created
  const KvBucket* bucket(const std::string& name) const;
  // Reads the value at `ref` from the log into `out`
  Status read(const ValueRef& ref, std::string& out) const;

private:
  const KvDb& db_;
};

// Forward iteration over one bucket; stays valid for the owning transaction
class Cursor {
public:
  Cursor(const ReadTxn& tx, const KvBucket& b) : tx_(&tx), b_(&b), it_(b.end()) {}
  bool first() { it_ = b_->begin(); return valid(); }
  // first key >= `key`
  bool seek(const std::string& key) { it_ = b_->lower_bound(key); return valid(); }
  bool next() { if (it_ != b_->end()) ++it_; return valid(); }
  bool valid() const { return it_ != b_->end(); }
  const std::string& key() const { return it_->first; }
  const ValueRef& ref() const { return it_->second; }
  Status value(std::string& out) const { return tx_->read(it_->second, out); }

private:
  const ReadTxn* tx_;
  const KvBucket* b_;
  KvBucket::const_iterator it_;
};

class WriteTxn {
public:
  Status create_bucket_if_not_exists(const std::string& name);
  // Fails if the bucket does not exist (in the store or earlier in this txn)
  Status put(const std::string& bucket, const std::string& key, const std::string& value);
  Status del(const std::string& bucket, const std::string& key);
  // Read-your-writes lookup; `found` is false when the key is absent
  Status get(const std::string& bucket, const std::string& key, std::string& out, bool& found) const;
  bool has_bucket(const std::string& name) const;
  size_t op_count() const { return ops_.size(); }

private:
  friend class KvDb;
  enum class OpType : uint8_t { CreateBucket = 1, Put = 2, Delete = 3 };
  struct Op { OpType type; std::string bucket, key, value; };

  explicit WriteTxn(const KvDb& db) : db_(db) {}

  const KvDb& db_;
  std::vector<Op> ops_;
};

class KvDb {
public:
  // Returns nullptr and sets `st` when the file cannot be opened or locked
  static std::unique_ptr<KvDb> open(const std::string& path, const KvOptions& opts, Status& st);
  ~KvDb();

  KvDb(const KvDb&) = delete;
  KvDb& operator=(const KvDb&) = delete;

  // Runs `fn` in a write transaction; commits when it returns ok, otherwise nothing is written
  Status update(const std::function<Status(WriteTxn&)>& fn);
  // Runs `fn` against a consistent snapshot
  Status view(const std::function<Status(const ReadTxn&)>& fn) const;

  // Rewrites the log with only live state
  Status compact();
  Status close();

  std::map<std::string, size_t> bucket_counts() const;
  const std::string& path() const { return path_; }
  uint64_t file_size() const;
  uint64_t truncated_bytes() const { return truncated_bytes_; }
  bool read_only() const { return opts_.read_only; }

private:
  friend class ReadTxn;
  friend class WriteTxn;

  using Index = std::map<std::string, KvBucket>;

  KvDb(std::string path, const KvOptions& opts, int fd);
  Status replay();
  Status append_txn(const std::string& buf);
  // Caller holds index_m_ or writer_m_ so fd_ stays put
  Status read_value(const ValueRef& ref, std::string& out) const;
  static void apply(Index& index, WriteTxn::OpType type, const std::string& bucket,
                    const std::string& key, const ValueRef& ref);
  // Returns the offset of the value within `buf`
  static size_t append_frame(std::string& buf, uint8_t type, const std::string& bucket,
                             const std::string& key, const std::string& value);

  std::string path_;
  KvOptions opts_;
  int fd_ = -1;
  bool closed_ = false;
  uint64_t committed_size_ = 0;
  uint64_t truncated_bytes_ = 0;

  Index index_;
  mutable std::mutex writer_m_;        // one writer at a time
  mutable std::shared_mutex index_m_;   // readers vs. publishing writer
};

} // namespace mdv
