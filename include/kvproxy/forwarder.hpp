#pragma once

#include <chrono>
#include <cstdio>
#include <string>
#include <string_view>

#include "kvproxy/channel.hpp"
#include "kvproxy/common.hpp"
#include "kvproxy/http.hpp"
#include "kvproxy/metrics.hpp"

namespace kvproxy {

enum class UpstreamFailure { kNone, kUnreachable, kTimeout };

inline unsigned upstream_status(UpstreamFailure failure) {
  return failure == UpstreamFailure::kTimeout ? 504u : 502u;
}

inline std::string upstream_error_body(const std::string& message) {
  return json{{"error", {{"type", "upstream_error"}, {"message", message}}}}.dump();
}

struct ForwardResult {
  unsigned status{0};
  std::string body;
  std::string content_type;
  std::string content_length;  // as reported by the backend, for HEAD replies
  UpstreamFailure failure{UpstreamFailure::kNone};
  std::string error;
};

struct StreamOutcome {
  bool started{false};     // a response head reached the client
  bool completed{false};   // the backend closed normally and the final chunk was sent
  bool client_gone{false};
  std::size_t bytes{0};
  double elapsed_s{0.0};
  UpstreamFailure failure{UpstreamFailure::kNone};
  std::string error;
};

// Headers for a relayed event stream; intermediaries must neither buffer nor cache it.
inline HeaderMap stream_relay_headers() {
  return HeaderMap{{"Cache-Control", "no-cache"}, {"X-Accel-Buffering", "no"}};
}

inline std::string guess_content_type(const std::string& body) {
  return json::accept(body) ? "application/json" : "text/plain; charset=utf-8";
}

// Issues calls to the inference backend. One libcurl handle per calling
// thread; a Forwarder itself holds only immutable settings.
class Forwarder {
 public:
  Forwarder(std::string backend_url, int timeout_s)
      : backend_url_(std::move(backend_url)), timeout_s_(timeout_s) {}

  const std::string& backend_url() const { return backend_url_; }

  // Waits for the complete response. The backend's status and body are
  // returned unchanged, parseable or not.
  ForwardResult forward(const std::string& method, const std::string& target, const std::string& body,
                        const HeaderMap& headers, int timeout_s = 0) const {
    HttpResponse resp = client().request(method, backend_url_ + target, body, headers,
                                         timeout_s > 0 ? timeout_s : timeout_s_);

    ForwardResult out;
    if (!resp.ok()) {
      out.failure = resp.timed_out() ? UpstreamFailure::kTimeout : UpstreamFailure::kUnreachable;
      out.error = resp.error;
      out.status = upstream_status(out.failure);
      out.body = upstream_error_body(resp.error);
      out.content_type = "application/json";
      metrics().inc(kMetricUpstreamErrors);
      Logger::log(Logger::Level::kError, "  → backend " + method + " " + target + " failed: " + resp.error);
      return out;
    }

    out.status = static_cast<unsigned>(resp.status);
    out.body = std::move(resp.body);
    out.content_type = resp.header("content-type");
    out.content_length = resp.header("content-length");
    if (out.content_type.empty()) {
      out.content_type = guess_content_type(out.body);
    }
    return out;
  }

  // Relays the backend's streamed body to `channel` chunk by chunk, exactly
  // as received. When the backend fails before the first byte the client gets
  // an upstream error response instead; after that point a failure just ends
  // the relay and the bytes already sent stand.
  StreamOutcome forward_stream(const std::string& target, const std::string& body, const HeaderMap& headers,
                               ClientChannel& channel) const {
    StreamOutcome out;
    const auto t0 = std::chrono::steady_clock::now();

    HttpResponse resp = client().request_stream(
        "POST", backend_url_ + target, body, headers,
        [&](long status, const std::map<std::string, std::string>& backend_headers) {
          const auto it = backend_headers.find("content-type");
          const std::string content_type = it == backend_headers.end() ? "text/event-stream" : it->second;
          out.started = true;
          if (!channel.begin_stream(static_cast<unsigned>(status), content_type, stream_relay_headers())) {
            out.client_gone = true;
            return false;
          }
          return true;
        },
        [&](std::string_view bytes) {
          if (!channel.write_chunk(bytes)) {
            out.client_gone = true;
            return false;
          }
          out.bytes += bytes.size();
          return true;
        },
        timeout_s_);

    out.elapsed_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    metrics().inc(kMetricStreams);
    metrics().inc(kMetricBytesRelayed, out.bytes);

    if (resp.ok() && !out.client_gone) {
      out.completed = channel.end_stream();
      out.client_gone = !out.completed;
    } else if (!out.client_gone) {
      out.failure = resp.timed_out() ? UpstreamFailure::kTimeout : UpstreamFailure::kUnreachable;
      out.error = resp.error;
      metrics().inc(kMetricUpstreamErrors);
      if (!out.started) {
        channel.send(upstream_status(out.failure), "application/json", upstream_error_body(resp.error), HeaderMap{});
      }
    }

    log_outcome(out);
    return out;
  }

 private:
  static HttpClient& client() {
    thread_local HttpClient c;
    return c;
  }

  static void log_outcome(const StreamOutcome& out) {
    char elapsed[32];
    std::snprintf(elapsed, sizeof(elapsed), "%.1f", out.elapsed_s);
    const std::string stats = std::string(elapsed) + "s, " + std::to_string(out.bytes) + " bytes";
    if (out.completed) {
      Logger::log(Logger::Level::kInfo, "  → stream done in " + stats);
    } else if (out.client_gone) {
      Logger::log(Logger::Level::kWarn, "  → client went away, stream dropped after " + stats);
    } else {
      Logger::log(Logger::Level::kError, "  → stream failed after " + stats + ": " + out.error);
    }
  }

  std::string backend_url_;
  int timeout_s_{300};
};

}  // namespace kvproxy
