#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "kvproxy/common.hpp"

namespace kvproxy {

// Byte range [begin, end) of one value inside a raw JSON document.
struct JsonSpan {
  std::size_t begin{0};
  std::size_t end{0};
};

struct JsonEdit {
  JsonSpan span;
  std::string text;
};

// Locates values inside a document that already parsed as JSON, so that
// single tokens can be swapped without re-serializing the rest: numbers,
// spacing and escapes elsewhere stay exactly as the client wrote them.
class JsonCursor {
 public:
  explicit JsonCursor(const std::string& raw) : raw_(raw) {}

  std::optional<JsonSpan> root() const {
    const std::size_t begin = skip_ws(0);
    const std::size_t end = scan_value(begin);
    if (end == std::string::npos) {
      return std::nullopt;
    }
    return JsonSpan{begin, end};
  }

  bool is_object(const JsonSpan& span) const { return span.begin < raw_.size() && raw_[span.begin] == '{'; }
  bool is_array(const JsonSpan& span) const { return span.begin < raw_.size() && raw_[span.begin] == '['; }

  // The value of `key` in the object at `span`. With duplicate keys the last
  // one wins, as it does for nlohmann::json.
  std::optional<JsonSpan> member(const JsonSpan& span, const std::string& key) const {
    if (!is_object(span)) {
      return std::nullopt;
    }
    std::optional<JsonSpan> found;
    std::size_t i = skip_ws(span.begin + 1);
    if (i < raw_.size() && raw_[i] == '}') {
      return std::nullopt;
    }
    while (i < span.end) {
      const std::size_t key_end = scan_string(i);
      if (key_end == std::string::npos) {
        return std::nullopt;
      }
      const std::optional<std::string> name = decode_string(i, key_end);
      if (!name) {
        return std::nullopt;
      }
      i = skip_ws(key_end);
      if (i >= raw_.size() || raw_[i] != ':') {
        return std::nullopt;
      }
      const std::size_t value_begin = skip_ws(i + 1);
      const std::size_t value_end = scan_value(value_begin);
      if (value_end == std::string::npos) {
        return std::nullopt;
      }
      if (*name == key) {
        found = JsonSpan{value_begin, value_end};
      }
      i = skip_ws(value_end);
      if (i < raw_.size() && raw_[i] == ',') {
        i = skip_ws(i + 1);
        continue;
      }
      break;
    }
    return found;
  }

  std::optional<std::vector<JsonSpan>> elements(const JsonSpan& span) const {
    if (!is_array(span)) {
      return std::nullopt;
    }
    std::vector<JsonSpan> out;
    std::size_t i = skip_ws(span.begin + 1);
    if (i < raw_.size() && raw_[i] == ']') {
      return out;
    }
    while (i < span.end) {
      const std::size_t end = scan_value(i);
      if (end == std::string::npos) {
        return std::nullopt;
      }
      out.push_back(JsonSpan{i, end});
      i = skip_ws(end);
      if (i < raw_.size() && raw_[i] == ',') {
        i = skip_ws(i + 1);
        continue;
      }
      break;
    }
    return out;
  }

 private:
  std::size_t skip_ws(std::size_t i) const {
    while (i < raw_.size() && (raw_[i] == ' ' || raw_[i] == '\t' || raw_[i] == '\n' || raw_[i] == '\r')) {
      ++i;
    }
    return i;
  }

  std::size_t scan_string(std::size_t i) const {
    if (i >= raw_.size() || raw_[i] != '"') {
      return std::string::npos;
    }
    for (++i; i < raw_.size(); ++i) {
      if (raw_[i] == '\\') {
        ++i;
      } else if (raw_[i] == '"') {
        return i + 1;
      }
    }
    return std::string::npos;
  }

  // End of the value starting at `i`. Containers are matched by depth only;
  // the document is known to be well formed.
  std::size_t scan_value(std::size_t i) const {
    if (i >= raw_.size()) {
      return std::string::npos;
    }
    if (raw_[i] == '"') {
      return scan_string(i);
    }
    if (raw_[i] == '{' || raw_[i] == '[') {
      int depth = 0;
      while (i < raw_.size()) {
        const char c = raw_[i];
        if (c == '"') {
          i = scan_string(i);
          if (i == std::string::npos) {
            return i;
          }
          continue;
        }
        if (c == '{' || c == '[') {
          ++depth;
        } else if ((c == '}' || c == ']') && --depth == 0) {
          return i + 1;
        }
        ++i;
      }
      return std::string::npos;
    }
    std::size_t j = i;
    while (j < raw_.size() && raw_[j] != ',' && raw_[j] != '}' && raw_[j] != ']' && raw_[j] != ' ' &&
           raw_[j] != '\t' && raw_[j] != '\n' && raw_[j] != '\r') {
      ++j;
    }
    return j == i ? std::string::npos : j;
  }

  std::optional<std::string> decode_string(std::size_t begin, std::size_t end) const {
    try {
      return json::parse(raw_.substr(begin, end - begin)).get<std::string>();
    } catch (const json::exception&) {
      return std::nullopt;
    }
  }

  const std::string& raw_;
};

// Applies non-overlapping edits to `raw`, back to front.
inline std::string apply_json_edits(std::string raw, std::vector<JsonEdit> edits) {
  std::sort(edits.begin(), edits.end(),
            [](const JsonEdit& a, const JsonEdit& b) { return a.span.begin > b.span.begin; });
  for (const auto& e : edits) {
    raw.replace(e.span.begin, e.span.end - e.span.begin, e.text);
  }
  return raw;
}

}  // namespace kvproxy
