#pragma once
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mtrack {

// Append/read store of opaque payloads keyed by topic. Implementations must
// be safe for concurrent callers.
struct IStorage {
  virtual ~IStorage() = default;
  virtual void append_batch(const std::string& key,
                            const std::vector<std::string>& records) = 0;
  // All payloads ever appended under key, in any order.
  virtual std::vector<std::string> read_all(const std::string& key) = 0;
  virtual std::vector<std::string> list_keys() = 0;

  // Longest key append_batch() accepts.
  virtual size_t max_key_bytes() const {
    return std::numeric_limits<size_t>::max();
  }
};

// In-process store; used for tests and --no-store runs.
class MemoryStorage : public IStorage {
 public:
  void append_batch(const std::string& key,
                    const std::vector<std::string>& records) override;
  std::vector<std::string> read_all(const std::string& key) override;
  std::vector<std::string> list_keys() override;

  // Failure injection.
  void set_fail_writes(bool fail);
  void set_unavailable(bool unavailable);

  size_t batch_count() const;

 private:
  mutable std::mutex mtx_;
  std::map<std::string, std::vector<std::string>> series_;
  size_t batches_ = 0;
  bool fail_writes_ = false;
  bool unavailable_ = false;
};

// Empty path -> MemoryStorage, otherwise an LMDB environment at path.
std::unique_ptr<IStorage> make_storage(const std::string& path,
                                       size_t map_size_bytes = (1ull << 30));

}  // namespace mtrack
