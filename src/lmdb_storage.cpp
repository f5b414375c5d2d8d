#include "mtrack/lmdb_storage.hpp"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <set>

#include "mtrack/errors.hpp"
#include "mtrack/log.hpp"

namespace fs = std::filesystem;
namespace mtrack {

namespace {

constexpr size_t kSeqBytes = sizeof(uint64_t);
constexpr size_t kSuffixBytes = 1 + kSeqBytes;  // NUL separator + sequence

std::string err(const char* what, int rc) {
  return std::string(what) + ": " + mdb_strerror(rc);
}

std::string record_key(const std::string& topic, uint64_t seq) {
  std::string k = topic;
  k.push_back('\0');
  for (int shift = 56; shift >= 0; shift -= 8)
    k.push_back(static_cast<char>((seq >> shift) & 0xFF));
  return k;
}

uint64_t decode_seq(const MDB_val& key) {
  auto* p = static_cast<const uint8_t*>(key.mv_data) + key.mv_size - kSeqBytes;
  uint64_t seq = 0;
  for (size_t i = 0; i < kSeqBytes; ++i) seq = (seq << 8) | p[i];
  return seq;
}

// Key starts with topic followed by the separator.
bool in_range(const MDB_val& key, const std::string& topic) {
  return key.mv_size >= topic.size() + 1 &&
         std::memcmp(key.mv_data, topic.data(), topic.size()) == 0 &&
         static_cast<const char*>(key.mv_data)[topic.size()] == '\0';
}

bool belongs_to(const MDB_val& key, const std::string& topic) {
  return key.mv_size == topic.size() + kSuffixBytes && in_range(key, topic);
}

// Aborts the transaction unless it was committed.
struct TxnGuard {
  MDB_txn* txn = nullptr;
  ~TxnGuard() {
    if (txn) mdb_txn_abort(txn);
  }
  int commit() {
    int rc = mdb_txn_commit(txn);
    txn = nullptr;  // freed by commit in all cases
    return rc;
  }
};

struct CursorGuard {
  MDB_cursor* cur = nullptr;
  ~CursorGuard() {
    if (cur) mdb_cursor_close(cur);
  }
};

}  // namespace

LMDBStorage::LMDBStorage(const std::string& path, size_t map_size_bytes)
    : path_(path) {
  std::error_code ec;
  fs::create_directories(path_, ec);
  if (ec)
    throw StoreUnavailableError("cannot create " + path_ + ": " + ec.message());

  int rc = mdb_env_create(&env_);
  if (rc) throw StoreUnavailableError(err("mdb_env_create failed", rc));

  rc = mdb_env_set_mapsize(env_, map_size_bytes);
  if (rc) {
    mdb_env_close(env_);
    throw StoreUnavailableError(err("mdb_env_set_mapsize failed", rc));
  }

  // MDB_NOTLS: read txns are not bound to the opening thread.
  rc = mdb_env_open(env_, path_.c_str(), MDB_NOTLS, 0664);
  if (rc) {
    safe_err("[LMDBStorage] mdb_env_open failed (", rc,
             "): ", mdb_strerror(rc), " path=", path_);
    mdb_env_close(env_);
    throw StoreUnavailableError(err("mdb_env_open failed", rc));
  }

  MDB_txn* txn = nullptr;
  rc = mdb_txn_begin(env_, nullptr, 0, &txn);
  if (rc == MDB_SUCCESS) {
    rc = mdb_dbi_open(txn, nullptr, 0, &dbi_);
    if (rc == MDB_SUCCESS)
      rc = mdb_txn_commit(txn);
    else
      mdb_txn_abort(txn);
  }
  if (rc) {
    mdb_env_close(env_);
    env_ = nullptr;
    throw StoreUnavailableError(err("opening main database failed", rc));
  }

  max_topic_ =
      static_cast<size_t>(mdb_env_get_maxkeysize(env_)) - kSuffixBytes;
  open_ = true;
  safe_log("[LMDBStorage] opened ", path_);
}

LMDBStorage::~LMDBStorage() { close(); }

void LMDBStorage::close() {
  std::unique_lock<std::shared_mutex> lock(open_mtx_);
  if (!open_) return;
  open_ = false;
  mdb_env_close(env_);
  env_ = nullptr;
  safe_log("[LMDBStorage] closed ", path_);
}

uint64_t LMDBStorage::next_seq(MDB_txn* txn, const std::string& topic) {
  CursorGuard c;
  int rc = mdb_cursor_open(txn, dbi_, &c.cur);
  if (rc) throw FlushError(err("mdb_cursor_open failed", rc));

  // Seek past the topic's highest possible key, then step back to its last
  // record. Keys of topics containing NUL can sit in between; skip them.
  std::string probe = record_key(topic, ~0ull);
  MDB_val key{probe.size(), probe.data()};
  MDB_val val;
  rc = mdb_cursor_get(c.cur, &key, &val, MDB_SET_RANGE);
  if (rc == MDB_SUCCESS)
    rc = mdb_cursor_get(c.cur, &key, &val, MDB_PREV);
  else if (rc == MDB_NOTFOUND)
    rc = mdb_cursor_get(c.cur, &key, &val, MDB_LAST);

  while (rc == MDB_SUCCESS && in_range(key, topic) && !belongs_to(key, topic))
    rc = mdb_cursor_get(c.cur, &key, &val, MDB_PREV);

  if (rc == MDB_SUCCESS && belongs_to(key, topic)) return decode_seq(key) + 1;
  if (rc != MDB_SUCCESS && rc != MDB_NOTFOUND)
    throw FlushError(err("mdb_cursor_get failed", rc));
  return 0;
}

void LMDBStorage::append_batch(const std::string& key,
                               const std::vector<std::string>& records) {
  std::shared_lock<std::shared_mutex> lock(open_mtx_);
  if (!open_) throw StoreUnavailableError("store is closed: " + path_);
  if (records.empty()) return;
  if (key.size() > max_topic_)
    throw ValidationError("key of " + std::to_string(key.size()) +
                          " bytes exceeds the store limit of " +
                          std::to_string(max_topic_));

  TxnGuard g;
  int rc = mdb_txn_begin(env_, nullptr, 0, &g.txn);
  if (rc) {
    g.txn = nullptr;
    throw StoreUnavailableError(err("mdb_txn_begin failed", rc));
  }

  uint64_t seq = next_seq(g.txn, key);
  for (const auto& rec : records) {
    std::string k = record_key(key, seq++);
    MDB_val mk{k.size(), k.data()};
    MDB_val mv{rec.size(), const_cast<char*>(rec.data())};
    rc = mdb_put(g.txn, dbi_, &mk, &mv, 0);
    if (rc) throw FlushError(err("mdb_put failed", rc));
  }

  rc = g.commit();
  if (rc) throw FlushError(err("mdb_txn_commit failed", rc));
}

std::vector<std::string> LMDBStorage::read_all(const std::string& key) {
  std::shared_lock<std::shared_mutex> lock(open_mtx_);
  if (!open_) throw StoreUnavailableError("store is closed: " + path_);
  if (key.size() > max_topic_) return {};  // could never have been written

  TxnGuard g;
  int rc = mdb_txn_begin(env_, nullptr, MDB_RDONLY, &g.txn);
  if (rc) {
    g.txn = nullptr;
    throw StoreUnavailableError(err("mdb_txn_begin (read) failed", rc));
  }

  CursorGuard c;
  rc = mdb_cursor_open(g.txn, dbi_, &c.cur);
  if (rc) throw StoreUnavailableError(err("mdb_cursor_open failed", rc));

  std::string first = record_key(key, 0);
  MDB_val mk{first.size(), first.data()};
  MDB_val mv;
  std::vector<std::string> out;

  rc = mdb_cursor_get(c.cur, &mk, &mv, MDB_SET_RANGE);
  while (rc == MDB_SUCCESS) {
    if (!in_range(mk, key)) break;
    if (belongs_to(mk, key))
      out.emplace_back(static_cast<const char*>(mv.mv_data), mv.mv_size);
    rc = mdb_cursor_get(c.cur, &mk, &mv, MDB_NEXT);
  }
  if (rc != MDB_SUCCESS && rc != MDB_NOTFOUND)
    throw StoreUnavailableError(err("mdb_cursor_get failed", rc));
  return out;
}

std::vector<std::string> LMDBStorage::list_keys() {
  std::shared_lock<std::shared_mutex> lock(open_mtx_);
  if (!open_) throw StoreUnavailableError("store is closed: " + path_);

  TxnGuard g;
  int rc = mdb_txn_begin(env_, nullptr, MDB_RDONLY, &g.txn);
  if (rc) {
    g.txn = nullptr;
    throw StoreUnavailableError(err("mdb_txn_begin (read) failed", rc));
  }

  CursorGuard c;
  rc = mdb_cursor_open(g.txn, dbi_, &c.cur);
  if (rc) throw StoreUnavailableError(err("mdb_cursor_open failed", rc));

  MDB_val mk, mv;
  std::set<std::string> topics;
  while ((rc = mdb_cursor_get(c.cur, &mk, &mv, MDB_NEXT)) == MDB_SUCCESS) {
    if (mk.mv_size <= kSuffixBytes) continue;
    topics.emplace(static_cast<const char*>(mk.mv_data),
                   mk.mv_size - kSuffixBytes);
  }
  if (rc != MDB_NOTFOUND)
    throw StoreUnavailableError(err("mdb_cursor_get failed", rc));
  return {topics.begin(), topics.end()};
}

std::unique_ptr<IStorage> make_lmdb_storage(const std::string& path,
                                            size_t map_size_bytes) {
  return std::make_unique<LMDBStorage>(path, map_size_bytes);
}

}  // namespace mtrack
