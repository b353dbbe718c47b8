#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kvproxy/capture_log.hpp"

namespace kvproxy {

// Captured request bodies that carry an `input` member, in log order.
inline std::vector<ordered_json> extract_replay_bodies(const std::vector<CaptureBlock>& blocks) {
  std::vector<ordered_json> out;
  for (const auto& block : blocks) {
    try {
      ordered_json body = ordered_json::parse(block.body);
      if (body.is_object() && body.contains("input")) {
        out.push_back(std::move(body));
      }
    } catch (const json::exception&) {
      // Not a JSON request; skipped.
    }
  }
  return out;
}

inline std::string item_label(const ordered_json& item) {
  if (!item.is_object()) {
    return "?";
  }
  if (item.contains("type") && item["type"].is_string()) {
    return item["type"].get<std::string>();
  }
  if (item.contains("role") && item["role"].is_string()) {
    return item["role"].get<std::string>();
  }
  return "?";
}

// "3 items: [system, user, function_call]"
inline std::string summarize_input(const ordered_json& input) {
  if (!input.is_array()) {
    return "0 items: []";
  }
  std::string labels;
  for (std::size_t i = 0; i < input.size(); ++i) {
    if (i > 0) {
      labels += ", ";
    }
    labels += item_label(input[i]);
  }
  return std::to_string(input.size()) + " items: [" + labels + "]";
}

inline std::string item_role(const ordered_json& item) {
  if (item.is_object() && item.contains("role") && item["role"].is_string()) {
    return item["role"].get<std::string>();
  }
  return item_label(item);
}

// Index of the first request after the very first one whose input is just a
// system prompt and one user turn, i.e. where a fresh session began.
inline std::optional<std::size_t> find_session_reset(const std::vector<ordered_json>& bodies) {
  for (std::size_t i = 1; i < bodies.size(); ++i) {
    const auto it = bodies[i].find("input");
    if (it == bodies[i].end() || !it->is_array() || it->size() != 2) {
      continue;
    }
    if (item_role((*it)[0]) == "system" && item_role((*it)[1]) == "user") {
      return i;
    }
  }
  return std::nullopt;
}

// `obj[key]` when it is a string, else `fallback`. Event payloads are
// read field by field inside a libcurl callback, where nothing may throw.
inline std::string string_member(const json& obj, const char* key, const std::string& fallback = "") {
  if (!obj.is_object()) {
    return fallback;
  }
  const auto it = obj.find(key);
  return it != obj.end() && it->is_string() ? it->get<std::string>() : fallback;
}

// Accumulates a Responses API event stream into the final answer. Used on the
// receiving end of a replay, where splitting into lines is the point.
class SseCollector {
 public:
  void feed(std::string_view bytes) {
    buffer_.append(bytes.data(), bytes.size());
    std::size_t pos = 0;
    while ((pos = buffer_.find('\n')) != std::string::npos) {
      const std::string line = buffer_.substr(0, pos);
      buffer_.erase(0, pos + 1);
      handle_line(line);
    }
  }

  void finish() {
    if (!buffer_.empty()) {
      const std::string rest = std::move(buffer_);
      buffer_.clear();
      handle_line(rest);
    }
  }

  std::string output_text() const { return trim(output_text_); }
  const std::vector<std::string>& tool_calls() const { return tool_calls_; }
  const json& usage() const { return usage_; }

 private:
  void handle_line(const std::string& raw) {
    const std::string line = trim(raw);
    if (!starts_with(line, "data:")) {
      return;
    }
    const std::string data = trim(line.substr(5));
    if (data.empty()) {
      return;
    }

    json event;
    try {
      event = json::parse(data);
    } catch (const json::exception&) {
      return;
    }
    if (!event.is_object()) {
      return;
    }

    const std::string type = string_member(event, "type");
    if (type == "response.output_text.delta") {
      output_text_ += string_member(event, "delta");
    } else if (type == "response.completed" && event.contains("response")) {
      on_completed(event["response"]);
    }
  }

  void on_completed(const json& response) {
    if (!response.is_object()) {
      return;
    }
    if (response.contains("usage") && response["usage"].is_object()) {
      usage_ = response["usage"];
    }
    if (!response.contains("output") || !response["output"].is_array()) {
      return;
    }
    for (const auto& item : response["output"]) {
      if (!item.is_object()) {
        continue;
      }
      const std::string type = string_member(item, "type");
      if (type == "function_call") {
        tool_calls_.push_back(string_member(item, "name", "?"));
      } else if (type == "message" && item.contains("content") && item["content"].is_array()) {
        for (const auto& block : item["content"]) {
          if (string_member(block, "type") == "output_text") {
            output_text_ = string_member(block, "text", output_text_);
          }
        }
      }
    }
  }

  std::string buffer_;
  std::string output_text_;
  std::vector<std::string> tool_calls_;
  json usage_{json::object()};
};

// First `max_chars` of `text`, noting the full length when cut.
inline std::string preview_text(const std::string& text, std::size_t max_chars = 400) {
  if (text.size() <= max_chars) {
    return text;
  }
  return text.substr(0, max_chars) + "... [" + std::to_string(text.size()) + " chars total]";
}

}  // namespace kvproxy
