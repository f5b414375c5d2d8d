#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "mtrack/sample.hpp"
#include "mtrack/storage.hpp"

namespace mtrack::test {

// Polls pred until it holds or timeout passes.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout =
                               std::chrono::milliseconds(5000)) {
  auto until = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < until) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return pred();
}

inline Sample sample_at_ms(int64_t ms, double dx = 0.0, double dy = 0.0) {
  return Sample{dx, dy, Clock::time_point(std::chrono::milliseconds(ms))};
}

// Store that remembers the size of every batch it accepted.
class RecordingStorage : public IStorage {
 public:
  void append_batch(const std::string& key,
                    const std::vector<std::string>& records) override {
    std::lock_guard<std::mutex> lock(mtx_);
    batch_sizes_.push_back(records.size());
    keys_.push_back(key);
    total_ += records.size();
  }
  std::vector<std::string> read_all(const std::string&) override { return {}; }
  std::vector<std::string> list_keys() override { return keys_snapshot(); }

  std::vector<size_t> batch_sizes() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return batch_sizes_;
  }
  std::vector<std::string> keys_snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return keys_;
  }
  size_t total() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return total_;
  }

 private:
  mutable std::mutex mtx_;
  std::vector<size_t> batch_sizes_;
  std::vector<std::string> keys_;
  size_t total_ = 0;
};

}  // namespace mtrack::test
