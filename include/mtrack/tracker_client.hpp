#pragma once
#include <grpcpp/grpcpp.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tracker.grpc.pb.h"

namespace mtrack {

// Thin blocking client for the Tracker service.
class TrackerClient {
 public:
  explicit TrackerClient(const std::string& target)
      : target_(target),
        channel_(
            grpc::CreateChannel(target, grpc::InsecureChannelCredentials())),
        stub_(rpc::Tracker::NewStub(channel_)) {}

  grpc::Status start(const std::vector<std::string>& user_ids,
                     rpc::StartReply* reply) {
    rpc::StartRequest req;
    for (auto& id : user_ids) req.add_user_ids(id);
    grpc::ClientContext ctx;
    return stub_->Start(&ctx, req, reply);
  }

  grpc::Status stop(rpc::StopReply* reply) {
    grpc::ClientContext ctx;
    return stub_->Stop(&ctx, rpc::StopRequest{}, reply);
  }

  grpc::Status fetch(const std::string& user_id, std::optional<double> min,
                     std::optional<double> max, rpc::FetchReply* reply) {
    rpc::FetchRequest req;
    req.set_user_id(user_id);
    if (min) req.set_min(*min);
    if (max) req.set_max(*max);
    grpc::ClientContext ctx;
    return stub_->Fetch(&ctx, req, reply);
  }

  const std::string& target() const { return target_; }

 private:
  std::string target_;
  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<rpc::Tracker::Stub> stub_;
};

}  // namespace mtrack
