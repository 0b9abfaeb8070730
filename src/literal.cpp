#include "litdiff/literal.hpp"

#include "litdiff/consts.hpp"
#include "litdiff/scanner.hpp"
#include "litdiff/util.hpp"

#include <algorithm>

namespace litdiff {

Shape classify(std::string_view text) {
  const std::string_view t = strutil::trim(text);
  Shape shape;
  if (t.empty())
    return shape;

  if (t.front() == '(') {
    const std::size_t close = matching_close(t, 0);
    if (close != std::string_view::npos) {
      const std::string_view rest = strutil::trim_left(t.substr(close + 1));
      if (rest.starts_with(consts::kTypeSep)) {
        shape.kind = ShapeKind::CallSignature;
        shape.args = strutil::trim(t.substr(1, close - 1));
        shape.ret = strutil::trim(rest.substr(consts::kTypeSep.size()));
        return shape;
      }
      if (close == t.size() - 1) {
        shape.kind = ShapeKind::Parenthesized;
        shape.body = strutil::trim(t.substr(1, close - 1));
        return shape;
      }
    }
    return shape;
  }

  if (t.starts_with(consts::kMapOpen)) {
    const std::size_t brace = consts::kMapOpen.size() - 1;
    const std::size_t close = matching_close(t, brace);
    if (close == t.size() - 1) {
      shape.kind = ShapeKind::MapLiteral;
      shape.body = strutil::trim(t.substr(brace + 1, close - brace - 1));
    }
  }
  return shape;
}

bool is_map_literal(std::string_view text) { return classify(text).kind == ShapeKind::MapLiteral; }

std::optional<std::string_view> map_body(std::string_view text) {
  Shape shape = classify(text);
  if (shape.kind == ShapeKind::Parenthesized)
    shape = classify(shape.body);
  if (shape.kind != ShapeKind::MapLiteral)
    return std::nullopt;
  return shape.body;
}

std::optional<std::pair<std::string, std::string>> split_key_value(std::string_view segment) {
  const std::size_t pos = segment.find(consts::kArrow);
  if (pos == std::string_view::npos)
    return std::nullopt;
  return std::make_pair(std::string(strutil::trim(segment.substr(0, pos))),
                        std::string(strutil::trim(segment.substr(pos + consts::kArrow.size()))));
}

bool is_filler_segment(std::string_view segment) {
  return segment.empty() || segment == consts::kElision;
}

std::optional<std::vector<Entry>> parse_map_literal(std::string_view text) {
  const auto body = map_body(text);
  if (!body)
    return std::nullopt;

  std::vector<Entry> entries;
  for (const std::string &segment : split_top_level(*body)) {
    if (is_filler_segment(segment))
      continue;
    auto kv = split_key_value(segment);
    if (!kv)
      return std::nullopt;
    if (auto it = std::find_if(entries.begin(), entries.end(),
                               [&](const Entry &e) { return e.key == kv->first; });
        it != entries.end()) {
      it->value = std::move(kv->second);
    } else {
      entries.push_back(Entry{.key = std::move(kv->first), .value = std::move(kv->second)});
    }
  }
  return entries;
}

const Entry *find_entry(const std::vector<Entry> &entries, std::string_view key) {
  for (const Entry &e : entries)
    if (e.key == key)
      return &e;
  return nullptr;
}

} // namespace litdiff
