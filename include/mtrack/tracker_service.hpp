#pragma once
#include <grpcpp/grpcpp.h>

#include <chrono>

#include "retriever.hpp"
#include "supervisor.hpp"
#include "tracker.grpc.pb.h"

namespace mtrack {

// Request layer over the supervisor and the retriever. Validates input,
// maps core errors onto gRPC status codes.
class TrackerService final : public rpc::Tracker::Service {
 public:
  TrackerService(SessionSupervisor& supervisor, Retriever& retriever,
                 std::chrono::steady_clock::duration session_duration)
      : supervisor_(supervisor),
        retriever_(retriever),
        session_duration_(session_duration) {}

  grpc::Status Start(grpc::ServerContext*, const rpc::StartRequest* req,
                     rpc::StartReply* reply) override;
  grpc::Status Stop(grpc::ServerContext*, const rpc::StopRequest* req,
                    rpc::StopReply* reply) override;
  grpc::Status Fetch(grpc::ServerContext*, const rpc::FetchRequest* req,
                     rpc::FetchReply* reply) override;

 private:
  SessionSupervisor& supervisor_;
  Retriever& retriever_;
  std::chrono::steady_clock::duration session_duration_;
};

}  // namespace mtrack
