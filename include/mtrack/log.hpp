#pragma once
#include <atomic>
#include <iostream>
#include <mutex>

namespace mtrack {

inline std::atomic<bool>& quiet_flag() {
  static std::atomic<bool> quiet{false};
  return quiet;
}

// Silences safe_log(); safe_err() always prints.
inline void set_quiet(bool quiet) { quiet_flag().store(quiet); }

// ─────────────── Thread-safe logging helpers ───────────────
template <typename... Args>
void safe_log(Args&&... args) {
  if (quiet_flag().load(std::memory_order_relaxed)) return;
  static std::mutex log_mtx;
  std::lock_guard<std::mutex> lock(log_mtx);
  (std::cout << ... << args) << std::endl;
}

template <typename... Args>
void safe_err(Args&&... args) {
  static std::mutex log_mtx;
  std::lock_guard<std::mutex> lock(log_mtx);
  (std::cerr << ... << args) << std::endl;
}
// ──────────────────────────────────────────────────────────

}  // namespace mtrack
