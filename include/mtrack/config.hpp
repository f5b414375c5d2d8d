#pragma once
#include <chrono>
#include <cstdint>
#include <string>

#include "generator.hpp"

namespace mtrack {

struct TrackerConfig {
  std::string db_path = "./user_movement_db";  // LMDB environment directory
  std::string listen_addr = "0.0.0.0:8080";
  std::chrono::seconds session_duration{30};
  uint64_t seed = 0;              // 0 = random per process
  size_t map_size = (1ull << 30);  // LMDB map size in bytes
  GeneratorConfig gen;
  bool no_store = false;  // keep samples in memory only
  bool quiet = false;
  bool read_mode = false;  // dump the store instead of serving
  int dump_n = 0;          // samples to print per user in read mode
};

}  // namespace mtrack
