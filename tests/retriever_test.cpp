#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <random>

#include "mtrack/errors.hpp"
#include "mtrack/log.hpp"
#include "mtrack/retriever.hpp"
#include "mtrack/sample_codec.hpp"
#include "test_util.hpp"

using namespace mtrack;
using mtrack::test::sample_at_ms;

using Bounds = std::pair<size_t, size_t>;

// Ten samples t0 < ... < t9 stored in shuffled order over three batches.
static void seed_ten(MemoryStorage& store, const std::string& user) {
  std::vector<std::string> recs;
  for (int i = 0; i < 10; ++i)
    recs.push_back(SampleCodec::encode(sample_at_ms(1000 + i, i, -i)));
  std::shuffle(recs.begin(), recs.end(), std::mt19937(12345));

  const std::string key = topic_for(user);
  store.append_batch(key, {recs.begin(), recs.begin() + 4});
  store.append_batch(key, {recs.begin() + 4, recs.begin() + 7});
  store.append_batch(key, {recs.begin() + 7, recs.end()});
}

static void test_window_bounds() {
  assert(window_bounds(10, 0.2, 0.5) == Bounds(2, 5));
  assert(window_bounds(10, 0.0, 1.0) == Bounds(0, 10));
  assert(window_bounds(10, 0.5, 0.5) == Bounds(5, 5));
  assert(window_bounds(0, 0.0, 1.0) == Bounds(0, 0));
  assert(window_bounds(3, 0.0, 0.99) == Bounds(0, 2));

  // Out-of-range input is clamped, not rejected.
  assert(window_bounds(10, -1.0, 2.0) == Bounds(0, 10));
  assert(window_bounds(10, 0.8, 0.3) == Bounds(3, 3));
  assert(window_bounds(10, 0.5, -0.5) == Bounds(0, 0));
  const double nan = std::numeric_limits<double>::quiet_NaN();
  assert(window_bounds(10, nan, nan) == Bounds(0, 10));
  assert(window_bounds(10, nan, 0.4) == Bounds(0, 4));
}

static void test_window_size_matches_floor_difference() {
  for (size_t n = 0; n <= 37; ++n) {
    for (int lo = 0; lo <= 10; ++lo) {
      for (int hi = lo; hi <= 10; ++hi) {
        double min = lo / 10.0, max = hi / 10.0;
        auto [start, end] = window_bounds(n, min, max);
        size_t expect = size_t(std::floor(max * n)) - size_t(std::floor(min * n));
        assert(start <= end && end <= n);
        assert(end - start == expect);
      }
    }
  }
}

static void test_scenario_fraction_window() {
  MemoryStorage store;
  seed_ten(store, "u1");
  Retriever r(store);

  auto got = r.fetch("u1", 0.2, 0.5);
  assert(got.size() == 3);
  assert(got[0].ts == sample_at_ms(1002).ts);
  assert(got[1].ts == sample_at_ms(1003).ts);
  assert(got[2].ts == sample_at_ms(1004).ts);
  assert(got[0].dx == 2.0 && got[0].dy == -2.0);
}

static void test_full_fetch_is_sorted() {
  MemoryStorage store;
  seed_ten(store, "u1");
  Retriever r(store);

  auto all = r.fetch("u1");
  assert(all.size() == 10);
  assert(std::is_sorted(all.begin(), all.end(), ts_less));
  assert(all.back().ts == sample_at_ms(1009).ts);  // max=1.0 keeps the last

  assert(r.fetch("u1", 0.5, 0.5).empty());
  assert(r.fetch("u1", 1.0, 1.0).empty());
  assert(r.fetch("u1", 0.9, 1.0).size() == 1);
}

static void test_corrupt_records_are_skipped() {
  MemoryStorage store;
  seed_ten(store, "u1");
  store.append_batch(topic_for("u1"),
                     {"not json", R"({"dx":1,"dy":2})", "{\"dx\":"});
  Retriever r(store);

  auto all = r.fetch("u1", 0.0, 1.0);
  assert(all.size() == 10);
  assert(std::is_sorted(all.begin(), all.end(), ts_less));
}

static void test_unrepresentable_timestamps_are_skipped() {
  MemoryStorage store;
  const std::string key = topic_for("u1");
  store.append_batch(key, {SampleCodec::encode(sample_at_ms(1760000000000)),
                           R"({"dx":1,"dy":1,"ts":"0001-01-01T00:00:00Z"})",
                           R"({"dx":2,"dy":2,"ts":"2300-01-01T00:00:00Z"})"});
  Retriever r(store);

  auto all = r.fetch("u1");
  assert(all.size() == 1);
  assert(all[0].dx == 0.0);
  assert(format_ts(all[0].ts) == "2025-10-09T08:53:20Z");
}

static void test_unknown_and_other_users() {
  MemoryStorage store;
  seed_ten(store, "u1");
  store.append_batch(topic_for("u2"),
                     {SampleCodec::encode(sample_at_ms(5))});
  Retriever r(store);

  assert(r.fetch("nobody").empty());
  assert(r.fetch("u2").size() == 1);
  assert(r.fetch("u1").size() == 10);
}

static void test_store_unavailable() {
  MemoryStorage store;
  store.set_unavailable(true);
  Retriever r(store);
  bool thrown = false;
  try {
    r.fetch("u1");
  } catch (const StoreUnavailableError&) {
    thrown = true;
  }
  assert(thrown);
}

int main() {
  set_quiet(true);
  test_window_bounds();
  test_window_size_matches_floor_difference();
  test_scenario_fraction_window();
  test_full_fetch_is_sorted();
  test_corrupt_records_are_skipped();
  test_unrepresentable_timestamps_are_skipped();
  test_unknown_and_other_users();
  test_store_unavailable();
  std::cout << "OK: retriever\n";
  return 0;
}
