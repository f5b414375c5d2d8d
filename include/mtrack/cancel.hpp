#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace mtrack {

enum class CancelCause : uint8_t { NONE = 0, MANUAL = 1, DEADLINE = 2 };

const char* to_string(CancelCause c);

namespace detail {
struct CancelState;
}

// Observer side of a cancellation node. Copyable; held by worker tasks.
class CancelToken {
 public:
  CancelToken() = default;

  bool cancelled() const;
  CancelCause cause() const;

  // Block until cancelled or the timeout/time point passes.
  // Returns true if cancelled.
  bool wait_for(std::chrono::steady_clock::duration d) const;
  bool wait_until(std::chrono::steady_clock::time_point tp) const;
  void wait() const;

 private:
  friend class CancelSource;
  explicit CancelToken(std::shared_ptr<detail::CancelState> s)
      : state_(std::move(s)) {}
  std::shared_ptr<detail::CancelState> state_;
};

// Owner side. Cancelling a source cancels every child derived from it;
// cancelling a child leaves the parent untouched. Cancel is idempotent: the
// first cause wins.
class CancelSource {
 public:
  CancelSource();

  CancelSource make_child() const;
  CancelToken token() const { return CancelToken(state_); }

  // Returns false if already cancelled, or if cause is NONE (ignored).
  bool cancel(CancelCause cause = CancelCause::MANUAL) const;
  bool cancelled() const { return token().cancelled(); }

 private:
  explicit CancelSource(std::shared_ptr<detail::CancelState> s)
      : state_(std::move(s)) {}
  std::shared_ptr<detail::CancelState> state_;
};

}  // namespace mtrack
