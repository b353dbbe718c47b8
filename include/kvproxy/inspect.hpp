#pragma once

#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include "kvproxy/capture_log.hpp"

namespace kvproxy {

struct RequestSummary {
  std::size_t index{0};
  std::string timestamp;
  std::string content_length{"?"};
  std::optional<std::size_t> input_items;
  bool has_tool_calls{false};
};

inline bool is_tool_call_item(const json& item) {
  if (!item.is_object() || !item.contains("type") || !item["type"].is_string()) {
    return false;
  }
  const std::string type = item["type"].get<std::string>();
  return type == "function_call" || type == "function_call_output";
}

inline RequestSummary summarize_block(const CaptureBlock& block, std::size_t index) {
  RequestSummary s;
  s.index = index;
  s.timestamp = block.timestamp;
  if (block.headers.is_object() && block.headers.contains("content-length") &&
      block.headers["content-length"].is_string()) {
    s.content_length = block.headers["content-length"].get<std::string>();
  }

  try {
    const json body = json::parse(block.body);
    if (body.is_object() && body.contains("input") && body["input"].is_array()) {
      const auto& items = body["input"];
      s.input_items = items.size();
      for (const auto& item : items) {
        if (is_tool_call_item(item)) {
          s.has_tool_calls = true;
          break;
        }
      }
    }
  } catch (const json::exception&) {
    // Unparseable bodies are reported with unknown counts.
  }
  return s;
}

// Summaries of every captured `method target` request, numbered from 1.
inline std::vector<RequestSummary> summarize_capture(const std::vector<CaptureBlock>& blocks,
                                                     const std::string& method, const std::string& target) {
  std::vector<RequestSummary> out;
  for (const auto& block : blocks) {
    if (block.method == method && block.target == target) {
      out.push_back(summarize_block(block, out.size() + 1));
    }
  }
  return out;
}

inline std::string format_summary(const RequestSummary& s) {
  char head[32];
  std::snprintf(head, sizeof(head), "Request %02zu", s.index);
  char length[32];
  std::snprintf(length, sizeof(length), "%7s", s.content_length.c_str());
  return std::string(head) + " | " + s.timestamp + " | content-length=" + length +
         " | input_items=" + (s.input_items ? std::to_string(*s.input_items) : std::string("?")) +
         " | tool_calls=" + (s.has_tool_calls ? "true" : "false");
}

}  // namespace kvproxy
