#pragma once

#include <optional>
#include <string>
#include <vector>

#include "kvproxy/common.hpp"
#include "kvproxy/json_splice.hpp"
#include "kvproxy/normalizer.hpp"

namespace kvproxy {

enum class ItemKind {
  kSystem,  // role "system", content is a string
  kUser,    // role "user", content is an array of blocks
  kOther,
};

struct NormalizationStats {
  int timestamps_removed{0};
  int message_ids_removed{0};
  int items_modified{0};

  bool empty() const { return timestamps_removed == 0 && message_ids_removed == 0; }
};

struct NormalizedInput {
  ordered_json items;
  NormalizationStats stats;
};

inline ItemKind classify_item(const ordered_json& item) {
  if (!item.is_object()) {
    return ItemKind::kOther;
  }
  const auto role = item.find("role");
  const auto content = item.find("content");
  if (role == item.end() || !role->is_string() || content == item.end()) {
    return ItemKind::kOther;
  }
  const std::string r = role->get<std::string>();
  if (r == "system" && content->is_string()) {
    return ItemKind::kSystem;
  }
  if (r == "user" && content->is_array()) {
    return ItemKind::kUser;
  }
  return ItemKind::kOther;
}

inline bool is_input_text_block(const ordered_json& block) {
  if (!block.is_object()) {
    return false;
  }
  const auto type = block.find("type");
  const auto text = block.find("text");
  return type != block.end() && type->is_string() && type->get<std::string>() == "input_text" &&
         text != block.end() && text->is_string();
}

namespace detail {

// Rewrites `field` in place when stripping changes it. Returns true on change.
inline bool strip_field(ordered_json& field, const NormalizeOptions& options, NormalizationStats& stats) {
  const std::string& original = field.get_ref<const std::string&>();
  TextStripResult r = strip_text(original, options);
  if (r.text == original) {
    return false;
  }
  field = std::move(r.text);
  stats.timestamps_removed += r.timestamps_removed;
  stats.message_ids_removed += r.message_ids_removed;
  return true;
}

}  // namespace detail

// Returns a normalized copy of a Responses API `input` array. Only the string
// content of system items and the text of user `input_text` blocks is
// rewritten; every other item and block is copied untouched, and nothing is
// added, removed or reordered.
inline NormalizedInput normalize_input(const ordered_json& items, const NormalizeOptions& options) {
  NormalizedInput out{items, NormalizationStats{}};
  if (!out.items.is_array()) {
    return out;
  }

  for (auto& item : out.items) {
    bool modified = false;
    switch (classify_item(item)) {
      case ItemKind::kSystem:
        modified = detail::strip_field(item["content"], options, out.stats);
        break;
      case ItemKind::kUser:
        for (auto& block : item["content"]) {
          if (is_input_text_block(block)) {
            modified = detail::strip_field(block["text"], options, out.stats) || modified;
          }
        }
        break;
      case ItemKind::kOther:
        break;
    }
    if (modified) {
      ++out.stats.items_modified;
    }
  }
  return out;
}

// Rewrites `raw_body` so that its `input` array carries the strings of
// `normalized`, replacing only the string tokens that changed. Everything
// else, including numbers that would not survive a parse and re-dump, stays
// byte-identical. `original` is the parsed `input` of `raw_body`. Returns
// nullopt when the raw text cannot be lined up with the parsed items.
inline std::optional<std::string> splice_normalized_input(const std::string& raw_body, const ordered_json& original,
                                                          const ordered_json& normalized) {
  if (!original.is_array() || !normalized.is_array() || original.size() != normalized.size()) {
    return std::nullopt;
  }
  const JsonCursor cursor(raw_body);
  const auto root = cursor.root();
  if (!root) {
    return std::nullopt;
  }
  const auto input = cursor.member(*root, "input");
  if (!input) {
    return std::nullopt;
  }
  const auto items = cursor.elements(*input);
  if (!items || items->size() != original.size()) {
    return std::nullopt;
  }

  std::vector<JsonEdit> edits;
  for (std::size_t i = 0; i < original.size(); ++i) {
    if (original[i] == normalized[i]) {
      continue;
    }
    const auto content = cursor.member((*items)[i], "content");
    if (!content) {
      return std::nullopt;
    }
    switch (classify_item(original[i])) {
      case ItemKind::kSystem:
        edits.push_back(JsonEdit{*content, normalized[i].at("content").dump()});
        break;
      case ItemKind::kUser: {
        const auto blocks = cursor.elements(*content);
        const ordered_json& before = original[i].at("content");
        const ordered_json& after = normalized[i].at("content");
        if (!blocks || blocks->size() != before.size() || after.size() != before.size()) {
          return std::nullopt;
        }
        for (std::size_t j = 0; j < before.size(); ++j) {
          if (before[j] == after[j]) {
            continue;
          }
          const auto text = cursor.member((*blocks)[j], "text");
          if (!text) {
            return std::nullopt;
          }
          edits.push_back(JsonEdit{*text, after[j].at("text").dump()});
        }
        break;
      }
      case ItemKind::kOther:
        return std::nullopt;
    }
  }
  return apply_json_edits(raw_body, std::move(edits));
}

}  // namespace kvproxy
