#include "mtrack/tracker_service.hpp"

#include <vector>

#include "mtrack/errors.hpp"
#include "mtrack/log.hpp"
#include "mtrack/sample_codec.hpp"

namespace mtrack {

namespace {

bool valid_fraction(double f) { return f >= 0.0 && f <= 1.0; }  // false on NaN

}  // namespace

grpc::Status TrackerService::Start(grpc::ServerContext*,
                                   const rpc::StartRequest* req,
                                   rpc::StartReply* reply) {
  safe_log("[Tracker] start request for ", req->user_ids_size(), " users");
  std::vector<std::string> ids(req->user_ids().begin(), req->user_ids().end());

  size_t started = 0;
  try {
    started = supervisor_.start(ids, session_duration_);
  } catch (const ValidationError& e) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
  }

  double secs = std::chrono::duration<double>(session_duration_).count();
  reply->set_started(static_cast<uint32_t>(started));
  reply->set_duration_seconds(secs);
  reply->set_message("Simulation started for " + std::to_string(started) +
                     " users. Will run for approximately " +
                     std::to_string(static_cast<long long>(secs)) + "s.");
  return grpc::Status::OK;
}

grpc::Status TrackerService::Stop(grpc::ServerContext*, const rpc::StopRequest*,
                                  rpc::StopReply* reply) {
  supervisor_.stop();
  reply->set_message("All active simulations stopped.");
  return grpc::Status::OK;
}

grpc::Status TrackerService::Fetch(grpc::ServerContext*,
                                   const rpc::FetchRequest* req,
                                   rpc::FetchReply* reply) {
  const std::string& user_id = req->user_id();
  if (user_id.empty())
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "user_id is required");

  double min = req->has_min() ? req->min() : 0.0;
  double max = req->has_max() ? req->max() : 1.0;
  if (!valid_fraction(min))
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "Invalid 'min' parameter. Must be a float between 0.0 and 1.0.");
  if (!valid_fraction(max))
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "Invalid 'max' parameter. Must be a float between 0.0 and 1.0.");
  if (min > max)
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "'min' parameter cannot be greater than 'max' parameter.");

  safe_log("[Tracker] fetch ", user_id, " min=", min, " max=", max);

  std::vector<Sample> samples;
  try {
    samples = retriever_.fetch(user_id, min, max);
  } catch (const StoreUnavailableError& e) {
    safe_err("[Tracker] error reading data for ", user_id, ": ", e.what());
    return grpc::Status(grpc::StatusCode::INTERNAL,
                        "retrieval failed for user " + user_id);
  }

  if (samples.empty())
    return grpc::Status(grpc::StatusCode::NOT_FOUND,
                        "No data found for user " + user_id +
                            " within the specified range");

  reply->set_user_id(user_id);
  reply->mutable_data()->Reserve(static_cast<int>(samples.size()));
  for (const auto& s : samples) SampleCodec::to_proto(s, reply->add_data());
  return grpc::Status::OK;
}

}  // namespace mtrack
