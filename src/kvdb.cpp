#include "kvdb.hpp"
#include "util.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace mdv {

namespace {

constexpr uint32_t kMagic = 0x4C56444Du; // "MDVL"
constexpr uint8_t kCommit = 4;
constexpr size_t kHeaderSize = 4 + 1 + 4 + 4 + 4;
constexpr size_t kTrailerSize = 8;
constexpr size_t kReadWindow = 1 << 20;  // replay reads the log in chunks of this size
constexpr uint64_t kCompactFlush = 1 << 20;
constexpr uint64_t kCompactOpsPerTxn = 4096;

std::string errno_str(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

Status write_all(int fd, const char* p, size_t n) {
  while (n > 0) {
    ssize_t w = ::write(fd, p, n);
    if (w < 0) {
      if (errno == EINTR) continue;
      return Status::error(errno_str("write"));
    }
    p += w;
    n -= (size_t)w;
  }
  return Status::success();
}

Status pread_all(int fd, char* p, size_t n, uint64_t off) {
  while (n > 0) {
    ssize_t r = ::pread(fd, p, n, (off_t)off);
    if (r < 0) {
      if (errno == EINTR) continue;
      return Status::error(errno_str("pread"));
    }
    if (r == 0) return Status::error("short read at offset " + std::to_string(off));
    p += r;
    n -= (size_t)r;
    off += (uint64_t)r;
  }
  return Status::success();
}

// Sequential window over the log for replay; holds at most one chunk or one frame
class LogWindow {
public:
  LogWindow(int fd, uint64_t size) : fd_(fd), size_(size) {}

  // Pointer to `n` bytes at `off`, or nullptr when they run past the end of the file.
  // A later call may invalidate the pointer.
  const char* at(uint64_t off, size_t n, Status& st) {
    if (off > size_ || n > size_ - off) return nullptr;
    if (off < base_ || off + n > base_ + buf_.size()) {
      uint64_t want = std::max<uint64_t>(n, kReadWindow);
      want = std::min<uint64_t>(want, size_ - off);
      buf_.resize((size_t)want);
      st = pread_all(fd_, &buf_[0], buf_.size(), off);
      if (!st) {
        buf_.clear();
        return nullptr;
      }
      base_ = off;
    }
    return buf_.data() + (off - base_);
  }

private:
  int fd_;
  uint64_t size_;
  uint64_t base_ = 0;
  std::string buf_;
};

bool lock_file(int fd, bool shared, int timeout_ms) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  for (;;) {
    if (::flock(fd, (shared ? LOCK_SH : LOCK_EX) | LOCK_NB) == 0) return true;
    if (errno != EWOULDBLOCK && errno != EINTR) return false;
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

// Fixed-width little-endian integers, independent of host byte order
template <typename U>
void put_le(std::string& buf, U v) {
  unsigned char b[sizeof(U)];
  for (size_t i = 0; i < sizeof(U); ++i) b[i] = (unsigned char)((uint64_t)v >> (8 * i));
  buf.append((const char*)b, sizeof(U));
}

template <typename U>
U get_le(const char* p) {
  unsigned char b[sizeof(U)];
  std::memcpy(b, p, sizeof(U));
  uint64_t v = 0;
  for (size_t i = 0; i < sizeof(U); ++i) v |= (uint64_t)b[i] << (8 * i);
  return (U)v;
}

Status sync_dir_of(const std::string& path) {
  auto slash = path.find_last_of('/');
  std::string dir = slash == std::string::npos ? "." : path.substr(0, slash == 0 ? 1 : slash);
  int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dfd < 0) return Status::error(errno_str("open dir"));
  int rc = ::fsync(dfd);
  ::close(dfd);
  if (rc != 0) return Status::error(errno_str("fsync dir"));
  return Status::success();
}

} // namespace

const KvBucket* ReadTxn::bucket(const std::string& name) const {
  auto it = db_.index_.find(name);
  return it == db_.index_.end() ? nullptr : &it->second;
}

Status ReadTxn::read(const ValueRef& ref, std::string& out) const {
  return db_.read_value(ref, out);
}

bool WriteTxn::has_bucket(const std::string& name) const {
  if (db_.index_.count(name)) return true;
  for (const auto& op : ops_)
    if (op.type == OpType::CreateBucket && op.bucket == name) return true;
  return false;
}

Status WriteTxn::create_bucket_if_not_exists(const std::string& name) {
  if (name.empty()) return Status::error("bucket name required");
  if (has_bucket(name)) return Status::success();
  ops_.push_back(Op{OpType::CreateBucket, name, {}, {}});
  return Status::success();
}

Status WriteTxn::put(const std::string& bucket, const std::string& key, const std::string& value) {
  if (key.empty()) return Status::error("key required");
  if (!has_bucket(bucket)) return Status::error("bucket not found: " + bucket);
  ops_.push_back(Op{OpType::Put, bucket, key, value});
  return Status::success();
}

Status WriteTxn::del(const std::string& bucket, const std::string& key) {
  if (!has_bucket(bucket)) return Status::error("bucket not found: " + bucket);
  ops_.push_back(Op{OpType::Delete, bucket, key, {}});
  return Status::success();
}

Status WriteTxn::get(const std::string& bucket, const std::string& key, std::string& out, bool& found) const {
  found = false;
  for (auto it = ops_.rbegin(); it != ops_.rend(); ++it) {
    if (it->bucket != bucket || it->key != key) continue;
    if (it->type == OpType::Delete) return Status::success();
    if (it->type == OpType::Put) {
      out = it->value;
      found = true;
      return Status::success();
    }
  }
  auto b = db_.index_.find(bucket);
  if (b == db_.index_.end()) return Status::success();
  auto kv = b->second.find(key);
  if (kv == b->second.end()) return Status::success();
  Status st = db_.read_value(kv->second, out);
  found = (bool)st;
  return st;
}

KvDb::KvDb(std::string path, const KvOptions& opts, int fd) : path_(std::move(path)), opts_(opts), fd_(fd) {}

KvDb::~KvDb() {
  Status st = close();
  if (!st) spdlog::warn("[KvDb] close {}: {}", path_, st.message);
}

std::unique_ptr<KvDb> KvDb::open(const std::string& path, const KvOptions& opts, Status& st) {
  int flags = opts.read_only ? (O_RDONLY | O_CLOEXEC) : (O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC);
  int fd = ::open(path.c_str(), flags, 0600);
  if (fd < 0) {
    st = Status::error(errno_str(("open " + path).c_str()));
    return nullptr;
  }
  if (!lock_file(fd, opts.read_only, opts.lock_timeout_ms)) {
    ::close(fd);
    st = Status::error("timeout acquiring lock on " + path + " (held by another process?)");
    return nullptr;
  }
  std::unique_ptr<KvDb> db(new KvDb(path, opts, fd));
  st = db->replay();
  if (!st) return nullptr; // destructor releases the lock
  return db;
}

size_t KvDb::append_frame(std::string& buf, uint8_t type, const std::string& bucket,
                          const std::string& key, const std::string& value) {
  size_t start = buf.size();
  put_le<uint32_t>(buf, kMagic);
  put_le<uint8_t>(buf, type);
  put_le<uint32_t>(buf, (uint32_t)bucket.size());
  put_le<uint32_t>(buf, (uint32_t)key.size());
  put_le<uint32_t>(buf, (uint32_t)value.size());
  buf += bucket;
  buf += key;
  size_t value_at = buf.size();
  buf += value;
  uint64_t sum = fnv1a64(buf.data() + start + 4, buf.size() - start - 4);
  put_le<uint64_t>(buf, sum);
  return value_at;
}

void KvDb::apply(Index& index, WriteTxn::OpType type, const std::string& bucket,
                 const std::string& key, const ValueRef& ref) {
  switch (type) {
    case WriteTxn::OpType::CreateBucket: index[bucket]; break;
    case WriteTxn::OpType::Put: index[bucket][key] = ref; break;
    case WriteTxn::OpType::Delete: {
      auto it = index.find(bucket);
      if (it != index.end()) it->second.erase(key);
      break;
    }
  }
}

Status KvDb::read_value(const ValueRef& ref, std::string& out) const {
  if (fd_ < 0) return Status::error("database closed");
  out.resize(ref.size);
  if (ref.size == 0) return Status::success();
  return pread_all(fd_, &out[0], out.size(), ref.offset);
}

Status KvDb::replay() {
  struct stat sb;
  if (::fstat(fd_, &sb) != 0) return Status::error(errno_str("fstat"));
  const uint64_t size = (uint64_t)sb.st_size;

  struct PendingOp {
    WriteTxn::OpType type;
    std::string bucket, key;
    ValueRef ref;
  };
  std::vector<PendingOp> pending;
  LogWindow w(fd_, size);
  Status st;
  uint64_t off = 0, good = 0;
  for (;;) {
    const char* p = w.at(off, kHeaderSize, st);
    if (!st) return st;
    if (!p || get_le<uint32_t>(p) != kMagic) break;
    uint8_t type = get_le<uint8_t>(p + 4);
    uint64_t blen = get_le<uint32_t>(p + 5);
    uint64_t klen = get_le<uint32_t>(p + 9);
    uint64_t vlen = get_le<uint32_t>(p + 13);
    uint64_t body = kHeaderSize + blen + klen + vlen;

    p = w.at(off, (size_t)(body + kTrailerSize), st);
    if (!st) return st;
    if (!p) break; // torn frame
    if (get_le<uint64_t>(p + body) != fnv1a64(p + 4, body - 4)) break;

    const char* q = p + kHeaderSize;
    if (type == kCommit) {
      if (vlen != sizeof(uint64_t) || get_le<uint64_t>(q + blen + klen) != pending.size()) break;
      for (const auto& op : pending) apply(index_, op.type, op.bucket, op.key, op.ref);
      pending.clear();
      off += body + kTrailerSize;
      good = off;
      continue;
    }
    if (type < 1 || type > 3) break;
    pending.push_back(PendingOp{static_cast<WriteTxn::OpType>(type), std::string(q, blen),
                                std::string(q + blen, klen),
                                ValueRef{off + kHeaderSize + blen + klen, (uint32_t)vlen}});
    off += body + kTrailerSize;
  }

  committed_size_ = good;
  if (good < size) {
    truncated_bytes_ = size - good;
    spdlog::warn("[KvDb] {}: discarding {} bytes after last commit", path_, truncated_bytes_);
    if (!opts_.read_only && ::ftruncate(fd_, (off_t)good) != 0) return Status::error(errno_str("ftruncate"));
  }
  return Status::success();
}

Status KvDb::append_txn(const std::string& buf) {
  Status st = write_all(fd_, buf.data(), buf.size());
  if (st && opts_.sync && ::fdatasync(fd_) != 0) st = Status::error(errno_str("fdatasync"));
  if (!st) {
    // roll the file back so replay never sees a partial transaction
    if (::ftruncate(fd_, (off_t)committed_size_) != 0)
      spdlog::error("[KvDb] rollback of {} failed: {}", path_, std::strerror(errno));
    return st;
  }
  committed_size_ += buf.size();
  return st;
}

Status KvDb::update(const std::function<Status(WriteTxn&)>& fn) {
  std::lock_guard<std::mutex> wl(writer_m_);
  if (closed_) return Status::error("database closed");
  if (opts_.read_only) return Status::error("database is read-only");

  WriteTxn tx(*this);
  Status st = fn(tx);
  if (!st) return st; // rollback: nothing staged reaches the log
  if (tx.ops_.empty()) return st;

  std::string buf;
  std::vector<size_t> value_at;
  value_at.reserve(tx.ops_.size());
  for (const auto& op : tx.ops_) value_at.push_back(append_frame(buf, (uint8_t)op.type, op.bucket, op.key, op.value));
  std::string count;
  put_le<uint64_t>(count, (uint64_t)tx.ops_.size());
  append_frame(buf, kCommit, {}, {}, count);

  const uint64_t base = committed_size_;
  st = append_txn(buf);
  if (!st) return st;

  std::unique_lock<std::shared_mutex> il(index_m_);
  for (size_t i = 0; i < tx.ops_.size(); ++i) {
    const auto& op = tx.ops_[i];
    apply(index_, op.type, op.bucket, op.key, ValueRef{base + value_at[i], (uint32_t)op.value.size()});
  }
  return st;
}

Status KvDb::view(const std::function<Status(const ReadTxn&)>& fn) const {
  std::shared_lock<std::shared_mutex> rl(index_m_);
  if (closed_) return Status::error("database closed");
  ReadTxn tx(*this);
  return fn(tx);
}

Status KvDb::compact() {
  std::lock_guard<std::mutex> wl(writer_m_);
  if (closed_) return Status::error("database closed");
  if (opts_.read_only) return Status::error("database is read-only");

  std::string tmp = path_ + ".compact";
  int tfd = ::open(tmp.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_APPEND | O_CLOEXEC, 0600);
  if (tfd < 0) return Status::error(errno_str("open compact file"));
  auto fail = [&](Status s) {
    ::close(tfd);
    ::unlink(tmp.c_str());
    return s;
  };
  if (::flock(tfd, LOCK_EX | LOCK_NB) != 0) return fail(Status::error(errno_str("lock compact file")));

  // live state is streamed into the new log as a series of bounded transactions
  Index fresh;
  std::string buf, value, count;
  uint64_t written = 0, ops = 0;
  Status st;
  auto commit = [&]() {
    if (ops == 0) return;
    count.clear();
    put_le<uint64_t>(count, ops);
    append_frame(buf, kCommit, {}, {}, count);
    ops = 0;
  };
  auto flush = [&]() -> Status {
    Status ws = write_all(tfd, buf.data(), buf.size());
    if (ws) written += buf.size();
    buf.clear();
    return ws;
  };
  // writer_m_ keeps fd_ and the index stable while values are copied
  for (const auto& b : index_) {
    append_frame(buf, (uint8_t)WriteTxn::OpType::CreateBucket, b.first, {}, {});
    ++ops;
    KvBucket& nb = fresh[b.first];
    for (const auto& kv : b.second) {
      st = read_value(kv.second, value);
      if (!st) return fail(st);
      size_t at = append_frame(buf, (uint8_t)WriteTxn::OpType::Put, b.first, kv.first, value);
      nb.emplace_hint(nb.end(), kv.first, ValueRef{written + at, (uint32_t)value.size()});
      if (++ops >= kCompactOpsPerTxn) commit();
      if (buf.size() >= kCompactFlush) {
        st = flush();
        if (!st) return fail(st);
      }
    }
  }
  commit();
  st = flush();
  if (!st) return fail(st);
  if (::fdatasync(tfd) != 0) return fail(Status::error(errno_str("fdatasync")));
  if (::rename(tmp.c_str(), path_.c_str()) != 0) return fail(Status::error(errno_str("rename")));
  st = sync_dir_of(path_);
  if (!st) spdlog::warn("[KvDb] {}", st.message);

  uint64_t before = committed_size_;
  {
    std::unique_lock<std::shared_mutex> il(index_m_);
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = tfd;
    index_.swap(fresh);
  }
  committed_size_ = written;
  spdlog::info("[KvDb] compacted {}: {} -> {} bytes", path_, before, committed_size_);
  return Status::success();
}

Status KvDb::close() {
  std::lock_guard<std::mutex> wl(writer_m_);
  std::unique_lock<std::shared_mutex> il(index_m_);
  if (closed_) return Status::success();
  closed_ = true;
  index_.clear();
  if (fd_ < 0) return Status::success();
  ::flock(fd_, LOCK_UN);
  int rc = ::close(fd_);
  fd_ = -1;
  if (rc != 0) return Status::error(errno_str("close"));
  return Status::success();
}

std::map<std::string, size_t> KvDb::bucket_counts() const {
  std::map<std::string, size_t> out;
  std::shared_lock<std::shared_mutex> rl(index_m_);
  for (const auto& b : index_) out[b.first] = b.second.size();
  return out;
}

uint64_t KvDb::file_size() const {
  std::lock_guard<std::mutex> wl(writer_m_);
  return committed_size_;
}

} // namespace mdv
