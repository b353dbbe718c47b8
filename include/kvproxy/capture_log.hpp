#pragma once

#include <cctype>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "kvproxy/channel.hpp"
#include "kvproxy/common.hpp"

namespace kvproxy {

// One request as recorded in a capture log.
struct CaptureBlock {
  std::string timestamp;
  std::string method;
  std::string target;
  json headers{json::object()};
  std::string body;
};

inline constexpr std::size_t kLogTimestampLength = 23;  // "2026-02-18 20:48:01,123"

// True when `line` opens with a log timestamp followed by a space.
inline bool is_timestamped_line(const std::string& line) {
  static constexpr char shape[] = "dddd-dd-dd dd:dd:dd,ddd";
  if (line.size() <= kLogTimestampLength || line[kLogTimestampLength] != ' ') {
    return false;
  }
  for (std::size_t i = 0; i < kLogTimestampLength; ++i) {
    const unsigned char c = static_cast<unsigned char>(line[i]);
    if (shape[i] == 'd' ? !std::isdigit(c) : line[i] != shape[i]) {
      return false;
    }
  }
  return true;
}

// Renders one capture block. JSON bodies are pretty-printed; anything else is
// indented by two spaces so that no body line can pass for a block separator.
inline std::string format_capture_block(const std::string& timestamp, const std::string& method,
                                        const std::string& target, const HeaderMap& headers,
                                        const std::string& body) {
  json header_json = json::object();
  for (const auto& [k, v] : headers) {
    header_json[to_lower(k)] = v;
  }

  std::ostringstream ss;
  ss << timestamp << " ==== " << method << " " << target << " ====\n";
  ss << timestamp << " HEADERS: " << header_json.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
  ss << timestamp << " BODY:\n";

  bool pretty = false;
  if (!body.empty()) {
    try {
      ss << ordered_json::parse(body).dump(2, ' ', false, json::error_handler_t::replace) << "\n";
      pretty = true;
    } catch (const json::exception&) {
      pretty = false;
    }
  }
  if (!pretty && !body.empty()) {
    std::istringstream in(body);
    std::string line;
    while (std::getline(in, line)) {
      ss << "  " << line << "\n";
    }
  }
  return ss.str();
}

// Append-only record of inbound requests, one block per request. Blocks from
// concurrent requests never interleave.
class CaptureLog {
 public:
  CaptureLog() = default;

  explicit CaptureLog(const fs::path& path) : path_(path) {
    if (path_.empty()) {
      return;
    }
    std::error_code ec;
    if (path_.has_parent_path()) {
      fs::create_directories(path_.parent_path(), ec);
    }
    out_.open(path_, std::ios::out | std::ios::binary | std::ios::app);
    if (!out_) {
      Logger::log(Logger::Level::kWarn, "Cannot open capture log " + path_.string() + "; capture disabled");
    }
  }

  CaptureLog(const CaptureLog&) = delete;
  CaptureLog& operator=(const CaptureLog&) = delete;

  bool enabled() const { return out_.is_open(); }
  const fs::path& path() const { return path_; }

  void record(const std::string& method, const std::string& target, const HeaderMap& headers,
              const std::string& body) {
    if (!enabled()) {
      return;
    }
    const std::string block = format_capture_block(now_log_timestamp(), method, target, headers, body);
    std::lock_guard<std::mutex> lock(mu_);
    out_ << block;
    out_.flush();
  }

 private:
  fs::path path_;
  std::ofstream out_;
  std::mutex mu_;
};

// Splits a capture log into its blocks. A block starts at a timestamped
// "==== METHOD TARGET ====" line and ends at the next one or at end of file;
// the body runs from the "BODY:" line to the next timestamped line.
inline std::vector<CaptureBlock> parse_capture_log(const std::string& text) {
  std::vector<CaptureBlock> blocks;
  std::istringstream in(text);
  std::string line;
  bool in_body = false;
  std::vector<std::string> body_lines;

  auto flush_body = [&]() {
    if (!blocks.empty() && in_body) {
      std::string body;
      for (std::size_t i = 0; i < body_lines.size(); ++i) {
        body += body_lines[i];
        if (i + 1 < body_lines.size()) {
          body += "\n";
        }
      }
      blocks.back().body = std::move(body);
    }
    body_lines.clear();
    in_body = false;
  };

  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (!is_timestamped_line(line)) {
      if (in_body) {
        body_lines.push_back(line);
      }
      continue;
    }

    flush_body();
    const std::string ts = line.substr(0, kLogTimestampLength);
    const std::string rest = line.substr(kLogTimestampLength + 1);

    if (starts_with(rest, "==== ") && rest.size() > 10 && rest.compare(rest.size() - 5, 5, " ====") == 0) {
      const std::string inner = rest.substr(5, rest.size() - 10);
      const auto sp = inner.find(' ');
      CaptureBlock block;
      block.timestamp = ts;
      block.method = inner.substr(0, sp);
      block.target = sp == std::string::npos ? std::string() : inner.substr(sp + 1);
      blocks.push_back(std::move(block));
      continue;
    }
    if (blocks.empty()) {
      continue;
    }
    if (starts_with(rest, "HEADERS: ")) {
      try {
        blocks.back().headers = json::parse(rest.substr(9));
      } catch (const json::exception&) {
        blocks.back().headers = json::object();
      }
    } else if (rest == "BODY:") {
      in_body = true;
    }
  }
  flush_body();
  return blocks;
}

}  // namespace kvproxy
