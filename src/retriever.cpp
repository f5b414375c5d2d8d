#include "mtrack/retriever.hpp"

#include <algorithm>
#include <cmath>

#include "mtrack/errors.hpp"
#include "mtrack/log.hpp"
#include "mtrack/sample_codec.hpp"

namespace mtrack {

std::pair<size_t, size_t> window_bounds(size_t n, double min_fraction,
                                        double max_fraction) {
  if (std::isnan(min_fraction)) min_fraction = 0.0;
  if (std::isnan(max_fraction)) max_fraction = 1.0;
  max_fraction = std::clamp(max_fraction, 0.0, 1.0);
  min_fraction = std::clamp(min_fraction, 0.0, max_fraction);

  const double dn = static_cast<double>(n);
  size_t start =
      std::min(static_cast<size_t>(std::floor(min_fraction * dn)), n);
  size_t end = std::min(static_cast<size_t>(std::floor(max_fraction * dn)), n);
  if (start > end) start = end;
  return {start, end};
}

std::vector<Sample> Retriever::fetch(const std::string& entity_id,
                                     double min_fraction,
                                     double max_fraction) const {
  auto raw = store_.read_all(topic_for(entity_id));
  if (raw.empty()) return {};

  std::vector<Sample> samples;
  samples.reserve(raw.size());
  size_t skipped = 0;
  for (const auto& rec : raw) {
    try {
      samples.push_back(SampleCodec::decode(rec));
    } catch (const EncodingError& e) {
      ++skipped;
      safe_err("[Retriever] skipping record for ", entity_id, ": ", e.what(),
               " data=", rec);
    }
  }
  if (skipped > 0)
    safe_log("[Retriever] ", entity_id, ": skipped ", skipped, " of ",
             raw.size(), " records");

  // Storage order is not chronological across flushes.
  std::stable_sort(samples.begin(), samples.end(), ts_less);

  auto [start, end] = window_bounds(samples.size(), min_fraction, max_fraction);
  return std::vector<Sample>(samples.begin() + start, samples.begin() + end);
}

}  // namespace mtrack
