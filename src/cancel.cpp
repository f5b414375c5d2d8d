#include "mtrack/cancel.hpp"

#include <algorithm>
#include <thread>

namespace mtrack {

namespace detail {

struct CancelState {
  mutable std::mutex mtx;
  std::condition_variable cv;
  CancelCause cause = CancelCause::NONE;
  std::vector<std::weak_ptr<CancelState>> children;
};

}  // namespace detail

using detail::CancelState;

const char* to_string(CancelCause c) {
  switch (c) {
    case CancelCause::NONE:
      return "none";
    case CancelCause::MANUAL:
      return "manual";
    case CancelCause::DEADLINE:
      return "deadline";
  }
  return "unknown";
}

bool CancelToken::cancelled() const { return cause() != CancelCause::NONE; }

CancelCause CancelToken::cause() const {
  if (!state_) return CancelCause::NONE;
  std::lock_guard<std::mutex> lock(state_->mtx);
  return state_->cause;
}

bool CancelToken::wait_until(std::chrono::steady_clock::time_point tp) const {
  if (!state_) {
    std::this_thread::sleep_until(tp);
    return false;
  }
  std::unique_lock<std::mutex> lock(state_->mtx);
  return state_->cv.wait_until(
      lock, tp, [&] { return state_->cause != CancelCause::NONE; });
}

bool CancelToken::wait_for(std::chrono::steady_clock::duration d) const {
  return wait_until(std::chrono::steady_clock::now() + d);
}

void CancelToken::wait() const {
  if (!state_) return;
  std::unique_lock<std::mutex> lock(state_->mtx);
  state_->cv.wait(lock, [&] { return state_->cause != CancelCause::NONE; });
}

CancelSource::CancelSource() : state_(std::make_shared<CancelState>()) {}

CancelSource CancelSource::make_child() const {
  auto child = std::make_shared<CancelState>();
  std::lock_guard<std::mutex> lock(state_->mtx);
  if (state_->cause != CancelCause::NONE) {
    child->cause = state_->cause;  // derived from a cancelled parent
  } else {
    // drop entries whose token holders are gone
    auto& ch = state_->children;
    ch.erase(std::remove_if(ch.begin(), ch.end(),
                            [](const auto& w) { return w.expired(); }),
             ch.end());
    ch.push_back(child);
  }
  return CancelSource(child);
}

bool CancelSource::cancel(CancelCause cause) const {
  if (cause == CancelCause::NONE) return false;  // not a cancellation
  std::vector<std::weak_ptr<CancelState>> children;
  {
    std::lock_guard<std::mutex> lock(state_->mtx);
    if (state_->cause != CancelCause::NONE) return false;
    state_->cause = cause;
    children.swap(state_->children);
  }
  state_->cv.notify_all();

  // Children are cancelled outside the parent lock; a child's lock is never
  // taken while holding its parent's.
  for (auto& w : children)
    if (auto c = w.lock()) CancelSource(c).cancel(cause);
  return true;
}

}  // namespace mtrack
