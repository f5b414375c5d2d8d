#pragma once
#include <lmdb.h>

#include <shared_mutex>
#include <string>

#include "storage.hpp"

namespace mtrack {

// All topics live in the main database of one environment. Record key is
// topic || 0x00 || 8-byte big-endian sequence, so a topic's records are
// contiguous and the next sequence is found by seeking past its last key.
class LMDBStorage final : public IStorage {
  MDB_env* env_ = nullptr;
  MDB_dbi dbi_ = 0;
  std::string path_;
  std::shared_mutex open_mtx_;  // shared: operations, exclusive: close()
  bool open_ = false;
  size_t max_topic_ = 0;  // env key limit minus the record suffix

 public:
  explicit LMDBStorage(const std::string& path,
                       size_t map_size_bytes = (1ull << 30));
  ~LMDBStorage() override;

  void append_batch(const std::string& key,
                    const std::vector<std::string>& records) override;
  std::vector<std::string> read_all(const std::string& key) override;
  std::vector<std::string> list_keys() override;
  size_t max_key_bytes() const override { return max_topic_; }

  // Further calls throw StoreUnavailableError.
  void close();
  const std::string& path() const { return path_; }

 private:
  uint64_t next_seq(MDB_txn* txn, const std::string& topic);
};

std::unique_ptr<IStorage> make_lmdb_storage(const std::string& path,
                                            size_t map_size_bytes);

}  // namespace mtrack
