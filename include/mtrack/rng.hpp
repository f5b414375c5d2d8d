// rng.hpp
#pragma once
#include <cstdint>
#include <string>

namespace mtrack {

struct SplitMix64 {
  uint64_t x;
  explicit SplitMix64(uint64_t seed) : x(seed) {}
  uint64_t next() {
    uint64_t z = (x += 0x9E3779B97F4A7C15ull);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
    return z ^ (z >> 31);
  }
};

struct Xoroshiro128Plus {
  uint64_t s0, s1;
  explicit Xoroshiro128Plus(uint64_t seed = 1) {
    SplitMix64 sm(seed);
    s0 = sm.next();
    s1 = sm.next();
  }
  static inline uint64_t rotl(uint64_t x, int k) {
    return (x << k) | (x >> (64 - k));
  }
  uint64_t next_u64() {
    uint64_t r = s0 + s1;
    s1 ^= s0;
    s0 = rotl(s0, 55) ^ s1 ^ (s1 << 14);
    s1 = rotl(s1, 36);
    return r;
  }
  double next_uniform01() {  // [0,1)
    // 53-bit mantissa -> double in [0,1)
    return (next_u64() >> 11) * (1.0 / 9007199254740992.0);
  }
};

// Uniform in [lo, hi).
inline double rand_uniform(Xoroshiro128Plus& rng, double lo, double hi) {
  return lo + (hi - lo) * rng.next_uniform01();
}

// Per-entity seed: distinct streams for distinct (base, index, id) triples.
inline uint64_t derive_seed(uint64_t base, uint64_t index,
                            const std::string& entity_id) {
  uint64_t h = 0xCBF29CE484222325ull;  // FNV-1a
  for (unsigned char c : entity_id) {
    h ^= c;
    h *= 0x100000001B3ull;
  }
  SplitMix64 sm(base ^ (index * 0x9E3779B97F4A7C15ull));
  return sm.next() ^ h;
}

}  // namespace mtrack
