#include "mtrack/storage.hpp"

#include "mtrack/errors.hpp"
#include "mtrack/lmdb_storage.hpp"

namespace mtrack {

void MemoryStorage::append_batch(const std::string& key,
                                 const std::vector<std::string>& records) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (unavailable_) throw StoreUnavailableError("memory store unavailable");
  if (fail_writes_) throw FlushError("memory store rejected batch");
  auto& dst = series_[key];
  dst.insert(dst.end(), records.begin(), records.end());
  ++batches_;
}

std::vector<std::string> MemoryStorage::read_all(const std::string& key) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (unavailable_) throw StoreUnavailableError("memory store unavailable");
  auto it = series_.find(key);
  if (it == series_.end()) return {};
  return it->second;
}

std::vector<std::string> MemoryStorage::list_keys() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (unavailable_) throw StoreUnavailableError("memory store unavailable");
  std::vector<std::string> keys;
  keys.reserve(series_.size());
  for (auto& kv : series_) keys.push_back(kv.first);
  return keys;
}

void MemoryStorage::set_fail_writes(bool fail) {
  std::lock_guard<std::mutex> lock(mtx_);
  fail_writes_ = fail;
}

void MemoryStorage::set_unavailable(bool unavailable) {
  std::lock_guard<std::mutex> lock(mtx_);
  unavailable_ = unavailable;
}

size_t MemoryStorage::batch_count() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return batches_;
}

std::unique_ptr<IStorage> make_storage(const std::string& path,
                                       size_t map_size_bytes) {
  if (path.empty()) return std::make_unique<MemoryStorage>();
  return make_lmdb_storage(path, map_size_bytes);
}

}  // namespace mtrack
