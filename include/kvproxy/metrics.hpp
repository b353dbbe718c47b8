#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "kvproxy/common.hpp"

namespace kvproxy {

inline constexpr const char* kMetricRequests = "requests";
inline constexpr const char* kMetricNormalized = "normalized";
inline constexpr const char* kMetricStreams = "streams";
inline constexpr const char* kMetricUpstreamErrors = "upstreamErrors";
inline constexpr const char* kMetricTimestampsRemoved = "timestampsRemoved";
inline constexpr const char* kMetricMessageIdsRemoved = "messageIdsRemoved";
inline constexpr const char* kMetricBytesRelayed = "bytesRelayed";

class Metrics {
 public:
  void inc(const std::string& key, uint64_t delta = 1) {
    std::lock_guard<std::mutex> lock(mu_);
    counters_[key] += delta;
  }

  uint64_t get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = counters_.find(key);
    return it == counters_.end() ? 0 : it->second;
  }

  json to_json() const {
    std::lock_guard<std::mutex> lock(mu_);
    json j = json::object();
    for (const auto& kv : counters_) {
      j[kv.first] = kv.second;
    }
    j["updatedAt"] = now_iso8601();
    return j;
  }

 private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, uint64_t> counters_;
};

inline Metrics& metrics() {
  static Metrics m;
  return m;
}

inline fs::path default_metrics_path() {
  return expand_user_path("~/.kvproxy") / "state" / "metrics.json";
}

inline bool write_metrics_snapshot(const fs::path& path = default_metrics_path()) {
  return write_text_file(path, metrics().to_json().dump(2));
}

}  // namespace kvproxy
