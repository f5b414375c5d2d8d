#include <algorithm>
#include <cassert>
#include <iostream>

#include "mtrack/log.hpp"
#include "mtrack/sample_codec.hpp"
#include "mtrack/tracker_service.hpp"
#include "test_util.hpp"

using namespace std::chrono_literals;
using namespace mtrack;
using mtrack::test::sample_at_ms;

struct Fixture {
  MemoryStorage store;
  SessionSupervisor supervisor{store, GeneratorConfig{}, 11};
  Retriever retriever{store};
  TrackerService service{supervisor, retriever, 5s};
};

static rpc::FetchRequest fetch_req(const std::string& user) {
  rpc::FetchRequest req;
  req.set_user_id(user);
  return req;
}

static void test_start_validation() {
  Fixture f;
  rpc::StartRequest req;
  rpc::StartReply reply;

  auto st = f.service.Start(nullptr, &req, &reply);
  assert(st.error_code() == grpc::StatusCode::INVALID_ARGUMENT);

  req.add_user_ids("");
  st = f.service.Start(nullptr, &req, &reply);
  assert(st.error_code() == grpc::StatusCode::INVALID_ARGUMENT);
  assert(!f.supervisor.has_session());

  // A rejected Start still ends the running session.
  rpc::StartRequest one;
  one.add_user_ids("x");
  assert(f.service.Start(nullptr, &one, &reply).ok());
  assert(f.supervisor.has_session());
  rpc::StartRequest empty;
  st = f.service.Start(nullptr, &empty, &reply);
  assert(st.error_code() == grpc::StatusCode::INVALID_ARGUMENT);
  assert(!f.supervisor.has_session());
  assert(f.supervisor.active_count() == 0);

  req.add_user_ids("a");
  req.add_user_ids("b");
  st = f.service.Start(nullptr, &req, &reply);
  assert(st.ok());
  assert(reply.started() == 2);
  assert(reply.duration_seconds() == 5.0);
  assert(f.supervisor.active_count() == 2);

  rpc::StopReply stop;
  assert(f.service.Stop(nullptr, nullptr, &stop).ok());
  assert(f.supervisor.active_count() == 0);
  assert(f.service.Stop(nullptr, nullptr, &stop).ok());  // always OK
}

static void test_fetch_validation() {
  Fixture f;
  rpc::FetchReply reply;

  auto req = fetch_req("");
  assert(f.service.Fetch(nullptr, &req, &reply).error_code() ==
         grpc::StatusCode::INVALID_ARGUMENT);

  req = fetch_req("u1");
  req.set_min(1.5);
  assert(f.service.Fetch(nullptr, &req, &reply).error_code() ==
         grpc::StatusCode::INVALID_ARGUMENT);

  req = fetch_req("u1");
  req.set_max(-0.1);
  assert(f.service.Fetch(nullptr, &req, &reply).error_code() ==
         grpc::StatusCode::INVALID_ARGUMENT);

  req = fetch_req("u1");
  req.set_min(0.6);
  req.set_max(0.4);
  assert(f.service.Fetch(nullptr, &req, &reply).error_code() ==
         grpc::StatusCode::INVALID_ARGUMENT);
}

static void test_fetch_results() {
  Fixture f;
  std::vector<std::string> recs;
  for (int i = 9; i >= 0; --i)
    recs.push_back(SampleCodec::encode(sample_at_ms(100 + i, i, 0)));
  f.store.append_batch(topic_for("u1"), recs);

  rpc::FetchReply reply;
  auto req = fetch_req("u1");  // defaults: min 0, max 1
  assert(f.service.Fetch(nullptr, &req, &reply).ok());
  assert(reply.user_id() == "u1");
  assert(reply.data_size() == 10);
  for (int i = 0; i < 10; ++i) assert(reply.data(i).dx() == i);

  reply.Clear();
  req.set_min(0.2);
  req.set_max(0.5);
  assert(f.service.Fetch(nullptr, &req, &reply).ok());
  assert(reply.data_size() == 3);
  assert(reply.data(0).dx() == 2.0);

  req.set_min(0.5);
  req.set_max(0.5);
  assert(f.service.Fetch(nullptr, &req, &reply).error_code() ==
         grpc::StatusCode::NOT_FOUND);

  req = fetch_req("nobody");
  assert(f.service.Fetch(nullptr, &req, &reply).error_code() ==
         grpc::StatusCode::NOT_FOUND);
}

static void test_fetch_store_failure() {
  Fixture f;
  f.store.set_unavailable(true);
  rpc::FetchReply reply;
  auto req = fetch_req("u1");
  auto st = f.service.Fetch(nullptr, &req, &reply);
  assert(st.error_code() == grpc::StatusCode::INTERNAL);
  assert(st.error_message().find("retrieval failed") != std::string::npos);
}

int main() {
  set_quiet(true);
  test_start_validation();
  test_fetch_validation();
  test_fetch_results();
  test_fetch_store_failure();
  std::cout << "OK: tracker_service\n";
  return 0;
}
