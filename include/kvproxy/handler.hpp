#pragma once

#include <string>

#include "kvproxy/capture_log.hpp"
#include "kvproxy/channel.hpp"
#include "kvproxy/config.hpp"
#include "kvproxy/forwarder.hpp"
#include "kvproxy/input_router.hpp"
#include "kvproxy/metrics.hpp"

namespace kvproxy {

struct InboundRequest {
  std::string method;
  std::string target;  // path plus query string, as sent by the client
  HeaderMap headers;   // lower-case names
  std::string body;

  std::string path() const { return target.substr(0, target.find('?')); }

  std::string header(const std::string& lower_name) const {
    const auto it = headers.find(lower_name);
    return it == headers.end() ? std::string() : it->second;
  }
};

class ProxyHandler {
 public:
  explicit ProxyHandler(Config config, CaptureLog* capture = nullptr)
      : config_(std::move(config)),
        forwarder_(config_.backend.url, config_.backend.timeout),
        capture_(capture) {}

  const Config& config() const { return config_; }

  void handle(const InboundRequest& req, ClientChannel& channel) const {
    metrics().inc(kMetricRequests);
    if (capture_) {
      capture_->record(req.method, req.target, req.headers, req.body);
    }

    const std::string path = req.path();
    if (req.method == "POST" && path == config_.routes.completion) {
      handle_completion(req, channel);
    } else if (req.method == "GET" && path == config_.routes.health) {
      handle_health(channel);
    } else if (req.method == "GET" && path == config_.routes.models) {
      const ForwardResult r =
          forwarder_.forward("GET", req.target, "", outbound_headers(req), config_.backend.models_timeout);
      channel.send(r.status, r.content_type, r.body, HeaderMap{});
    } else {
      Logger::log(Logger::Level::kInfo, "passthrough: " + req.method + " " + req.target);
      handle_passthrough(req, channel);
    }
  }

  json health_json() const {
    return json{
        {"status", "ok"},
        {"backend", config_.backend.url},
        {"strip_timestamps", config_.normalize.strip_timestamps},
        {"strip_message_ids", config_.normalize.strip_message_ids},
        {"metrics", metrics().to_json()},
    };
  }

 private:
  void handle_completion(const InboundRequest& req, ClientChannel& channel) const {
    ordered_json body;
    try {
      body = ordered_json::parse(req.body);
    } catch (const json::exception& e) {
      Logger::log(Logger::Level::kWarn, "POST " + req.target + " body is not JSON (" + e.what() +
                                            "); forwarding unmodified");
      handle_passthrough(req, channel);
      return;
    }
    if (!body.is_object()) {
      Logger::log(Logger::Level::kWarn, "POST " + req.target + " body is not an object; forwarding unmodified");
      handle_passthrough(req, channel);
      return;
    }

    const auto stream_it = body.find("stream");
    const bool is_stream = stream_it != body.end() && stream_it->is_boolean() && stream_it->get<bool>();

    std::size_t n_items = 0;
    NormalizationStats stats;
    std::string outgoing = req.body;
    const auto input_it = body.find("input");
    if (input_it != body.end() && input_it->is_array()) {
      n_items = input_it->size();
      const NormalizedInput normalized = normalize_input(*input_it, config_.normalize);
      stats = normalized.stats;
      if (stats.items_modified > 0) {
        if (auto spliced = splice_normalized_input(req.body, *input_it, normalized.items)) {
          outgoing = std::move(*spliced);
        } else {
          Logger::log(Logger::Level::kWarn,
                      "POST " + req.target + " input could not be located in the raw body; forwarding unmodified");
          stats = NormalizationStats{};
        }
      }
    }

    metrics().inc(kMetricNormalized);
    metrics().inc(kMetricTimestampsRemoved, static_cast<uint64_t>(stats.timestamps_removed));
    metrics().inc(kMetricMessageIdsRemoved, static_cast<uint64_t>(stats.message_ids_removed));

    Logger::log(Logger::Level::kInfo,
                "POST " + req.target + " | items=" + std::to_string(n_items) +
                    " | ts_removed=" + std::to_string(stats.timestamps_removed) +
                    " | msg_ids_removed=" + std::to_string(stats.message_ids_removed) +
                    " | items_modified=" + std::to_string(stats.items_modified) +
                    " | stream=" + (is_stream ? "true" : "false"));
    if (stats.empty()) {
      Logger::log(Logger::Level::kWarn, "  → no volatile fields found; prompt sent as-is");
    }

    if (is_stream) {
      forwarder_.forward_stream(req.target, outgoing, outbound_headers(req), channel);
      return;
    }

    const ForwardResult r = forwarder_.forward("POST", req.target, outgoing, outbound_headers(req));
    channel.send(r.status, r.content_type, r.body, HeaderMap{});
  }

  void handle_health(ClientChannel& channel) const {
    channel.send(200, "application/json", health_json().dump(), HeaderMap{});
  }

  void handle_passthrough(const InboundRequest& req, ClientChannel& channel) const {
    const ForwardResult r = forwarder_.forward(req.method, req.target, req.body, outbound_headers(req));
    HeaderMap extra;
    if (req.method == "HEAD" && !r.content_length.empty()) {
      extra["Content-Length"] = r.content_length;
    }
    channel.send(r.status, r.content_type, r.body, extra);
  }

  static HeaderMap outbound_headers(const InboundRequest& req) {
    HeaderMap out;
    const std::string content_type = req.header("content-type");
    out["Content-Type"] = content_type.empty() ? "application/json" : content_type;
    const std::string authorization = req.header("authorization");
    if (!authorization.empty()) {
      out["Authorization"] = authorization;
    }
    const std::string accept = req.header("accept");
    if (!accept.empty()) {
      out["Accept"] = accept;
    }
    return out;
  }

  const Config config_;
  Forwarder forwarder_;
  CaptureLog* capture_{nullptr};
};

}  // namespace kvproxy
