#pragma once
#include <string>

#include "sample.hpp"
#include "sample.pb.h"

namespace mtrack {

// Converts Sample <-> protobuf SampleRecord <-> JSON payload.
struct SampleCodec {
  static void to_proto(const Sample& src, SampleRecord* dst);
  // Throws EncodingError if ts does not fit Clock::time_point.
  static Sample from_proto(const SampleRecord& p);

  // Throws EncodingError.
  static std::string encode(const Sample& s);
  static Sample decode(const std::string& payload);
};

// RFC-3339 in UTC, e.g. 2026-10-19T12:00:00.123Z
std::string format_ts(Clock::time_point ts);

}  // namespace mtrack
