#pragma once
#include <atomic>
#include <chrono>
#include <string>
#include <vector>

#include "cancel.hpp"
#include "rng.hpp"
#include "sample.hpp"
#include "storage.hpp"

namespace mtrack {

struct GeneratorConfig {
  size_t batch_size = 100;                          // size trigger
  std::chrono::milliseconds flush_interval{100};    // time trigger
  std::chrono::microseconds sample_interval{1000};  // generation pace
  double max_step = 0.004;                          // max displacement per step
};

struct GeneratorStats {
  std::atomic<uint64_t> generated{0};
  std::atomic<uint64_t> flushed{0};  // records the store accepted
  std::atomic<uint64_t> dropped{0};  // records lost to encode/flush failures
  std::atomic<uint64_t> flushes{0};  // successful batch writes
};

// Random-walk producer for one entity. Buffers samples and writes them to
// the store when the buffer fills or the flush interval elapses, whichever
// comes first. Flushes are at-most-once: failures are logged and the batch
// is dropped.
class Generator {
 public:
  Generator(GeneratorConfig cfg, IStorage& store, std::string entity_id,
            uint64_t seed);
  Generator(const Generator&) = delete;
  Generator& operator=(const Generator&) = delete;

  // Runs until token is cancelled, then flushes what is buffered.
  void run(const CancelToken& token);

  const std::string& entity_id() const { return entity_id_; }
  const GeneratorStats& stats() const { return stats_; }

  // One displacement: direction uniform in [0, 2pi), magnitude uniform in
  // [0, max_step].
  static Sample make_step(Xoroshiro128Plus& rng, double max_step,
                          Clock::time_point ts);

 private:
  void flush(const char* reason);

  GeneratorConfig cfg_;
  IStorage& store_;
  std::string entity_id_;
  std::string topic_;
  Xoroshiro128Plus rng_;
  std::vector<Sample> buffer_;
  GeneratorStats stats_;
};

}  // namespace mtrack
