#include "mtrack/generator.hpp"

#include <algorithm>
#include <cmath>

#include "mtrack/errors.hpp"
#include "mtrack/log.hpp"
#include "mtrack/sample_codec.hpp"

namespace mtrack {

namespace {
constexpr double kTwoPi = 6.283185307179586476925;
}

Generator::Generator(GeneratorConfig cfg, IStorage& store,
                     std::string entity_id, uint64_t seed)
    : cfg_(cfg),
      store_(store),
      entity_id_(std::move(entity_id)),
      topic_(topic_for(entity_id_)),
      rng_(seed) {
  if (cfg_.batch_size == 0) cfg_.batch_size = 1;
  buffer_.reserve(cfg_.batch_size);
}

Sample Generator::make_step(Xoroshiro128Plus& rng, double max_step,
                            Clock::time_point ts) {
  double angle = rand_uniform(rng, 0.0, kTwoPi);
  double magnitude = rand_uniform(rng, 0.0, max_step);
  return Sample{magnitude * std::cos(angle), magnitude * std::sin(angle), ts};
}

void Generator::run(const CancelToken& token) {
  using steady = std::chrono::steady_clock;
  safe_log("[Generator] starting ", entity_id_);

  auto next_flush = steady::now() + cfg_.flush_interval;
  auto next_sample = steady::now();

  for (;;) {
    if (token.cancelled()) {
      if (!buffer_.empty()) flush("final");
      break;
    }

    auto now = steady::now();
    if (now >= next_flush) {
      if (!buffer_.empty()) flush("timer");
      next_flush = steady::now() + cfg_.flush_interval;
      continue;
    }

    if (now >= next_sample) {
      buffer_.push_back(make_step(rng_, cfg_.max_step, Clock::now()));
      stats_.generated.fetch_add(1, std::memory_order_relaxed);

      // A slow flush must not cause a burst of catch-up samples.
      next_sample = std::max(next_sample + cfg_.sample_interval, now);

      if (buffer_.size() >= cfg_.batch_size) {
        flush("size");
        next_flush = steady::now() + cfg_.flush_interval;
      }
      continue;
    }

    token.wait_until(std::min(next_sample, next_flush));
  }

  safe_log("[Generator] stopping ", entity_id_, " (",
           to_string(token.cause()), ") generated=", stats_.generated.load(),
           " flushed=", stats_.flushed.load(),
           " dropped=", stats_.dropped.load());
}

void Generator::flush(const char* reason) {
  // Swap out first: the next append always lands in a fresh buffer.
  std::vector<Sample> batch;
  batch.swap(buffer_);
  buffer_.reserve(cfg_.batch_size);

  std::vector<std::string> records;
  records.reserve(batch.size());
  for (const auto& s : batch) {
    try {
      records.push_back(SampleCodec::encode(s));
    } catch (const EncodingError& e) {
      stats_.dropped.fetch_add(1, std::memory_order_relaxed);
      safe_err("[Generator] ", entity_id_, ": ", e.what());
    }
  }
  if (records.empty()) return;

  try {
    store_.append_batch(topic_, records);
    stats_.flushed.fetch_add(records.size(), std::memory_order_relaxed);
    stats_.flushes.fetch_add(1, std::memory_order_relaxed);
  } catch (const std::exception& e) {
    stats_.dropped.fetch_add(records.size(), std::memory_order_relaxed);
    safe_err("[Generator] ", reason, " flush of ", records.size(),
             " samples failed for ", entity_id_, ": ", e.what());
  }
}

}  // namespace mtrack
