#pragma once
#include <string>
#include <utility>
#include <vector>

#include "sample.hpp"
#include "storage.hpp"

namespace mtrack {

// Half-open [start, end) index range selected by a fraction window over n
// items. Out-of-range or NaN fractions are clamped, never rejected.
std::pair<size_t, size_t> window_bounds(size_t n, double min_fraction,
                                        double max_fraction);

class Retriever {
 public:
  explicit Retriever(IStorage& store) : store_(store) {}

  // Time-ordered slice of an entity's samples. Undecodable records are
  // skipped. Throws StoreUnavailableError.
  std::vector<Sample> fetch(const std::string& entity_id,
                            double min_fraction = 0.0,
                            double max_fraction = 1.0) const;

 private:
  IStorage& store_;
};

}  // namespace mtrack
