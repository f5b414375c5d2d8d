#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "cancel.hpp"
#include "generator.hpp"
#include "storage.hpp"

namespace mtrack {

// Per-entity cancellation capability. Only the supervisor's table holds
// one; the generator thread only sees the derived token.
struct GenerationHandle {
  CancelSource cancel;
  uint64_t session_id = 0;
  Clock::time_point started_at{};
};

struct Session {
  uint64_t id = 0;
  CancelSource root;
  std::chrono::steady_clock::time_point deadline{};
  std::vector<std::string> entities;
  std::vector<std::unique_ptr<Generator>> generators;
  std::vector<std::thread> workers;
  std::thread watcher;
  std::once_flag cleanup_once;  // shared by stop() and the deadline watcher
};

// Entity table and current session. Guarded by mtx; never held across a
// join, a flush or a generation step.
struct SupervisorState {
  std::mutex mtx;
  std::map<std::string, GenerationHandle> table;
  std::unique_ptr<Session> current;
  uint64_t next_session_id = 1;
};

// Runs at most one session: one generator thread per entity under a shared
// root cancellation source bound by a deadline. `store` must outlive the
// supervisor.
class SessionSupervisor {
 public:
  SessionSupervisor(IStorage& store, GeneratorConfig gen_cfg,
                    uint64_t base_seed);
  ~SessionSupervisor();

  SessionSupervisor(const SessionSupervisor&) = delete;
  SessionSupervisor& operator=(const SessionSupervisor&) = delete;

  // Replaces any running session. Empty ids are skipped, duplicates are
  // started once. Throws ValidationError if no id remains or duration <= 0;
  // a running session is left untouched in that case.
  // Returns the number of generators started.
  size_t start(const std::vector<std::string>& entity_ids,
               std::chrono::steady_clock::duration duration);

  // Idempotent. Cancels the current session and waits for its threads.
  void stop();

  std::vector<std::string> active_entities() const;
  size_t active_count() const;
  // Generator loops that have not returned yet.
  size_t running_generators() const { return running_.load(); }
  // True while a session exists and has not been cancelled.
  bool has_session() const;

 private:
  void stop_locked();
  void watch(Session* s);
  void retire_locked(Session& s);
  static void join(Session& s);

  IStorage& store_;
  GeneratorConfig gen_cfg_;
  uint64_t base_seed_;

  std::mutex control_mtx_;  // serializes start()/stop()
  mutable SupervisorState state_;
  std::atomic<size_t> running_{0};
};

}  // namespace mtrack
