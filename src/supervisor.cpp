#include "mtrack/supervisor.hpp"

#include <set>

#include "mtrack/errors.hpp"
#include "mtrack/log.hpp"
#include "mtrack/rng.hpp"

namespace mtrack {

SessionSupervisor::SessionSupervisor(IStorage& store, GeneratorConfig gen_cfg,
                                     uint64_t base_seed)
    : store_(store), gen_cfg_(gen_cfg), base_seed_(base_seed) {}

SessionSupervisor::~SessionSupervisor() { stop(); }

size_t SessionSupervisor::start(const std::vector<std::string>& entity_ids,
                                std::chrono::steady_clock::duration duration) {
  std::lock_guard<std::mutex> control(control_mtx_);
  // The previous session ends even when this request is rejected below.
  stop_locked();

  if (entity_ids.empty()) throw ValidationError("User ID list cannot be empty");
  if (duration <= std::chrono::steady_clock::duration::zero())
    throw ValidationError("session duration must be positive");

  std::vector<std::string> ids;
  std::set<std::string> seen;
  const size_t max_topic = store_.max_key_bytes();
  for (const auto& id : entity_ids) {
    if (id.empty()) {
      safe_log("[Supervisor] skipping empty user id");
      continue;
    }
    if (!seen.insert(id).second) {
      safe_log("[Supervisor] skipping duplicate user id '", id, "'");
      continue;
    }
    if (topic_for(id).size() > max_topic)
      throw ValidationError("user id too long for the store (" +
                            std::to_string(id.size()) + " bytes)");
    ids.push_back(id);
  }
  if (ids.empty()) throw ValidationError("user id list has no usable ids");

  auto owned = std::make_unique<Session>();
  Session& s = *owned;
  s.deadline = std::chrono::steady_clock::now() + duration;
  s.entities = ids;

  std::lock_guard<std::mutex> lock(state_.mtx);
  s.id = state_.next_session_id++;
  // Installed before any thread exists so stop() can always join them.
  state_.current = std::move(owned);

  try {
    for (size_t i = 0; i < ids.size(); ++i) {
      CancelSource child = s.root.make_child();
      auto gen = std::make_unique<Generator>(
          gen_cfg_, store_, ids[i], derive_seed(base_seed_ + s.id, i, ids[i]));
      Generator* g = gen.get();
      s.generators.push_back(std::move(gen));
      state_.table[ids[i]] = GenerationHandle{child, s.id, Clock::now()};

      running_.fetch_add(1);
      try {
        s.workers.emplace_back([this, g, tok = child.token()] {
          g->run(tok);
          running_.fetch_sub(1);
        });
      } catch (...) {
        running_.fetch_sub(1);
        throw;
      }
    }
    s.watcher = std::thread([this, sp = &s] { watch(sp); });
  } catch (const std::exception& e) {
    safe_err("[Supervisor] failed to set up session ", s.id, ": ", e.what());
    s.root.cancel();
    retire_locked(s);
    throw;
  }

  safe_log("[Supervisor] session ", s.id, " started for ", ids.size(),
           " users, deadline in ",
           std::chrono::duration_cast<std::chrono::milliseconds>(duration)
               .count(),
           " ms");
  return ids.size();
}

void SessionSupervisor::stop() {
  std::lock_guard<std::mutex> control(control_mtx_);
  stop_locked();
}

void SessionSupervisor::stop_locked() {
  std::unique_ptr<Session> s;
  {
    std::lock_guard<std::mutex> lock(state_.mtx);
    s = std::move(state_.current);
    if (!s) {
      safe_log("[Supervisor] stop requested, but no simulations are active");
      return;
    }
    safe_log("[Supervisor] stopping session ", s->id, " (",
             s->entities.size(), " users)");
    s->root.cancel(CancelCause::MANUAL);  // no-op after a deadline
    retire_locked(*s);
  }

  join(*s);
  safe_log("[Supervisor] session ", s->id, " stopped");
}

void SessionSupervisor::watch(Session* s) {
  if (s->root.token().wait_until(s->deadline)) return;  // stopped or replaced

  // Loses to a concurrent stop(): then the cause is already MANUAL.
  if (!s->root.cancel(CancelCause::DEADLINE)) return;
  safe_log("[Supervisor] session ", s->id,
           " reached its deadline, stopping automatically");

  std::lock_guard<std::mutex> lock(state_.mtx);
  if (state_.current.get() == s) retire_locked(*s);
}

void SessionSupervisor::retire_locked(Session& s) {
  std::call_once(s.cleanup_once, [&] {
    for (auto it = state_.table.begin(); it != state_.table.end();) {
      if (it->second.session_id == s.id)
        it = state_.table.erase(it);
      else
        ++it;
    }
  });
}

void SessionSupervisor::join(Session& s) {
  for (auto& th : s.workers)
    if (th.joinable()) th.join();
  if (s.watcher.joinable()) s.watcher.join();
}

std::vector<std::string> SessionSupervisor::active_entities() const {
  std::lock_guard<std::mutex> lock(state_.mtx);
  std::vector<std::string> ids;
  ids.reserve(state_.table.size());
  for (auto& kv : state_.table) ids.push_back(kv.first);
  return ids;
}

size_t SessionSupervisor::active_count() const {
  std::lock_guard<std::mutex> lock(state_.mtx);
  return state_.table.size();
}

bool SessionSupervisor::has_session() const {
  std::lock_guard<std::mutex> lock(state_.mtx);
  return state_.current && !state_.current->root.cancelled();
}

}  // namespace mtrack
