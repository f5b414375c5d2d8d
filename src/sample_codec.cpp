#include "mtrack/sample_codec.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>

#include <cstdio>
#include <limits>

#include "mtrack/errors.hpp"

using google::protobuf::util::TimeUtil;

namespace mtrack {

namespace {

// Clock::time_point counts int64 nanoseconds: roughly years 1678 to 2262.
constexpr int64_t kMaxTsSeconds =
    std::numeric_limits<int64_t>::max() / 1000000000 - 1;

int64_t to_ns(Clock::time_point ts) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             ts.time_since_epoch())
      .count();
}

Clock::time_point from_ns(int64_t ns) {
  return Clock::time_point(std::chrono::duration_cast<Clock::duration>(
      std::chrono::nanoseconds(ns)));
}

}  // namespace

void SampleCodec::to_proto(const Sample& src, SampleRecord* dst) {
  dst->set_dx(src.dx);
  dst->set_dy(src.dy);
  *dst->mutable_ts() = TimeUtil::NanosecondsToTimestamp(to_ns(src.ts));
}

Sample SampleCodec::from_proto(const SampleRecord& p) {
  int64_t secs = p.ts().seconds();
  if (secs > kMaxTsSeconds || secs < -kMaxTsSeconds)
    throw EncodingError("sample timestamp out of range: " +
                        TimeUtil::ToString(p.ts()));
  return Sample{p.dx(), p.dy(),
                from_ns(TimeUtil::TimestampToNanoseconds(p.ts()))};
}

std::string SampleCodec::encode(const Sample& s) {
  SampleRecord rec;
  to_proto(s, &rec);

  google::protobuf::util::JsonPrintOptions opts;
  opts.preserve_proto_field_names = true;
  opts.always_print_primitive_fields = true;  // keep dx/dy even when 0.0

  std::string out;
  auto st = google::protobuf::util::MessageToJsonString(rec, &out, opts);
  if (!st.ok()) throw EncodingError("sample encode failed: " + st.ToString());
  return out;
}

Sample SampleCodec::decode(const std::string& payload) {
  SampleRecord rec;
  google::protobuf::util::JsonParseOptions opts;
  opts.ignore_unknown_fields = true;

  auto st = google::protobuf::util::JsonStringToMessage(payload, &rec, opts);
  if (!st.ok()) throw EncodingError("sample decode failed: " + st.ToString());
  if (!rec.has_ts()) throw EncodingError("sample decode failed: missing ts");
  return from_proto(rec);
}

std::string format_ts(Clock::time_point ts) {
  return TimeUtil::ToString(TimeUtil::NanosecondsToTimestamp(to_ns(ts)));
}

std::string Sample::to_string() const {
  char buf[64];
  snprintf(buf, sizeof(buf), "dx=%+.6f dy=%+.6f ", dx, dy);
  return buf + format_ts(ts);
}

}  // namespace mtrack
