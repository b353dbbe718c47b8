#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>

#include "kvproxy/config.hpp"

namespace kvproxy {

// Text with volatile fragments removed, plus how many fragments went.
struct StripResult {
  std::string text;
  int removed{0};
};

struct TextStripResult {
  std::string text;
  int timestamps_removed{0};
  int message_ids_removed{0};
};

namespace detail {

// Byte range [first, second) of one volatile fragment.
using Span = std::pair<std::size_t, std::size_t>;

inline const std::regex& timestamp_pattern() {
  // "[Wed 2026-02-18 20:48 UTC] " as prepended to every user turn.
  static const std::regex re(R"(\[(?:Mon|Tue|Wed|Thu|Fri|Sat|Sun) \d{4}-\d{2}-\d{2} \d{2}:\d{2} UTC\] )");
  return re;
}

inline std::optional<Span> find_timestamp(const std::string& text, std::size_t from) {
  std::smatch m;
  if (!std::regex_search(text.begin() + static_cast<std::ptrdiff_t>(from), text.end(), m, timestamp_pattern())) {
    return std::nullopt;
  }
  const std::size_t begin = from + static_cast<std::size_t>(m.position(0));
  return Span{begin, begin + static_cast<std::size_t>(m.length(0))};
}

inline bool is_pattern_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// One `"message_id": "..."` line of a JSON block embedded in prose, with its
// leading newline, indentation and optional trailing comma; the fragment
// `\n[ \t]*"message_id"\s*:\s*"[^"]+",?`. Linear scan; values are client
// text of unbounded length.
inline std::optional<Span> find_message_id(const std::string& text, std::size_t from) {
  static constexpr std::string_view key = "\"message_id\"";
  for (std::size_t k = text.find(key, from); k != std::string::npos; k = text.find(key, k + 1)) {
    std::size_t begin = k;
    while (begin > from && (text[begin - 1] == ' ' || text[begin - 1] == '\t')) {
      --begin;
    }
    if (begin == from || text[begin - 1] != '\n') {
      continue;
    }
    --begin;

    std::size_t i = k + key.size();
    while (i < text.size() && is_pattern_space(text[i])) {
      ++i;
    }
    if (i >= text.size() || text[i] != ':') {
      continue;
    }
    ++i;
    while (i < text.size() && is_pattern_space(text[i])) {
      ++i;
    }
    if (i >= text.size() || text[i] != '"') {
      continue;
    }
    const std::size_t close = text.find('"', i + 1);
    if (close == std::string::npos || close == i + 1) {
      continue;
    }
    std::size_t end = close + 1;
    if (end < text.size() && text[end] == ',') {
      ++end;
    }
    return Span{begin, end};
  }
  return std::nullopt;
}

// Removes every fragment `find_next` reports, repeating until nothing is
// found. A removal can join the text around it into a fresh fragment, so one
// pass is not enough to make the result stable under a second call.
template <typename FindNext>
inline StripResult remove_all(const std::string& text, FindNext find_next) {
  StripResult out{text, 0};
  for (;;) {
    std::string next;
    std::size_t last = 0;
    int hits = 0;
    for (auto span = find_next(out.text, 0); span; span = find_next(out.text, span->second)) {
      next.append(out.text, last, span->first - last);
      last = span->second;
      ++hits;
    }
    if (hits == 0) {
      return out;
    }
    next.append(out.text, last, std::string::npos);
    out.text = std::move(next);
    out.removed += hits;
  }
}

}  // namespace detail

inline StripResult strip_timestamps(const std::string& text) {
  if (text.find(" UTC] ") == std::string::npos) {
    return StripResult{text, 0};
  }
  return detail::remove_all(text, detail::find_timestamp);
}

inline StripResult strip_message_ids(const std::string& text) {
  if (text.find("\"message_id\"") == std::string::npos) {
    return StripResult{text, 0};
  }
  return detail::remove_all(text, detail::find_message_id);
}

// Timestamps first, then message ids. The two patterns never overlap, the
// fixed order only keeps counts reproducible.
inline TextStripResult strip_text(const std::string& text, const NormalizeOptions& options) {
  TextStripResult out{text, 0, 0};
  if (options.strip_timestamps) {
    StripResult r = strip_timestamps(out.text);
    out.text = std::move(r.text);
    out.timestamps_removed = r.removed;
  }
  if (options.strip_message_ids) {
    StripResult r = strip_message_ids(out.text);
    out.text = std::move(r.text);
    out.message_ids_removed = r.removed;
  }
  return out;
}

}  // namespace kvproxy
