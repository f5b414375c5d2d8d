#pragma once
#include <chrono>
#include <string>

namespace mtrack {

using Clock = std::chrono::system_clock;

// One recorded 2D displacement.
struct Sample {
  double dx{};
  double dy{};
  Clock::time_point ts{};

  std::string to_string() const;
};

inline bool ts_less(const Sample& a, const Sample& b) { return a.ts < b.ts; }

// Store key for one entity's series.
inline std::string topic_for(const std::string& entity_id) {
  return "user." + entity_id + ".location";
}

// Inverse of topic_for(); empty if key is not a user topic.
inline std::string entity_from_topic(const std::string& topic) {
  const std::string prefix = "user.", suffix = ".location";
  if (topic.size() < prefix.size() + suffix.size() ||
      topic.compare(0, prefix.size(), prefix) != 0 ||
      topic.compare(topic.size() - suffix.size(), suffix.size(), suffix) != 0)
    return {};
  return topic.substr(prefix.size(),
                      topic.size() - prefix.size() - suffix.size());
}

}  // namespace mtrack
