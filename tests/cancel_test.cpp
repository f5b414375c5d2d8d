#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "mtrack/cancel.hpp"

using namespace std::chrono_literals;
using mtrack::CancelCause;
using mtrack::CancelSource;

static void test_root_cancels_children() {
  CancelSource root;
  CancelSource a = root.make_child();
  CancelSource b = root.make_child();
  CancelSource grandchild = a.make_child();

  assert(!a.cancelled() && !b.cancelled() && !grandchild.cancelled());
  assert(root.cancel(CancelCause::DEADLINE));

  assert(a.token().cause() == CancelCause::DEADLINE);
  assert(b.token().cause() == CancelCause::DEADLINE);
  assert(grandchild.token().cause() == CancelCause::DEADLINE);
}

static void test_child_does_not_cancel_parent() {
  CancelSource root;
  CancelSource a = root.make_child();
  CancelSource b = root.make_child();

  assert(a.cancel());
  assert(a.cancelled());
  assert(!root.cancelled());
  assert(!b.cancelled());
}

static void test_first_cause_wins() {
  CancelSource root;
  assert(root.cancel(CancelCause::MANUAL));
  assert(!root.cancel(CancelCause::DEADLINE));
  assert(root.token().cause() == CancelCause::MANUAL);
}

static void test_none_cause_is_ignored() {
  CancelSource root;
  CancelSource child = root.make_child();

  assert(!root.cancel(CancelCause::NONE));
  assert(!root.cancelled());

  // The children are still attached to the root.
  assert(root.cancel(CancelCause::MANUAL));
  assert(child.token().cause() == CancelCause::MANUAL);
}

static void test_child_of_cancelled_parent() {
  CancelSource root;
  root.cancel(CancelCause::MANUAL);
  CancelSource late = root.make_child();
  assert(late.token().cause() == CancelCause::MANUAL);
}

static void test_wait() {
  CancelSource root;
  auto tok = root.make_child().token();

  auto t0 = std::chrono::steady_clock::now();
  assert(!tok.wait_for(20ms));
  assert(std::chrono::steady_clock::now() - t0 >= 20ms);

  std::thread canceller([&] {
    std::this_thread::sleep_for(20ms);
    root.cancel();
  });
  t0 = std::chrono::steady_clock::now();
  assert(tok.wait_for(10s));
  assert(std::chrono::steady_clock::now() - t0 < 5s);
  canceller.join();

  tok.wait();  // already cancelled, returns at once
}

static void test_empty_token() {
  mtrack::CancelToken tok;
  assert(!tok.cancelled());
  assert(!tok.wait_for(1ms));
}

int main() {
  test_root_cancels_children();
  test_child_does_not_cancel_parent();
  test_first_cause_wins();
  test_none_cause_is_ignored();
  test_child_of_cancelled_parent();
  test_wait();
  test_empty_token();
  std::cout << "OK: cancel\n";
  return 0;
}
