#include "litdiff/pretty.hpp"

#include "litdiff/ansi.hpp"
#include "litdiff/consts.hpp"
#include "litdiff/literal.hpp"
#include "litdiff/scanner.hpp"
#include "litdiff/util.hpp"

namespace litdiff {

namespace {

std::vector<std::string> format_map(std::string_view map_text, std::string_view body, int level,
                                    int depth);

std::vector<std::string> format_entry(const std::string &segment, int level,
                                      std::string_view suffix, int depth) {
  const std::string indent = strutil::repeat(consts::kIndentTwo, level);
  if (depth + 1 < consts::kMaxDepth) {
    if (const auto kv = split_key_value(segment)) {
      const Shape value = classify(kv->second);
      if (value.kind == ShapeKind::MapLiteral) {
        auto lines = format_map(kv->second, value.body, level, depth + 1);
        lines.front() = indent + kv->first + std::string(consts::kEntrySep) +
                        std::string(strutil::trim_left(lines.front()));
        lines.back().append(suffix);
        return lines;
      }
    }
  }
  return {indent + segment + std::string(suffix)};
}

std::vector<std::string> format_map(std::string_view map_text, std::string_view body, int level,
                                    int depth) {
  const std::string indent = strutil::repeat(consts::kIndentTwo, level);

  std::vector<std::string> segments;
  std::size_t counted = 0;
  for (auto &segment : split_top_level(body)) {
    if (segment.empty())
      continue;
    if (!is_filler_segment(segment))
      ++counted;
    segments.push_back(std::move(segment));
  }
  if (counted <= 1)
    return {indent + std::string(strutil::trim(map_text))};

  std::vector<std::string> lines;
  lines.push_back(indent + std::string(consts::kMapOpen));
  for (std::size_t i = 0; i < segments.size(); ++i) {
    const std::string_view suffix = (i + 1 < segments.size()) ? "," : "";
    for (auto &line : format_entry(segments[i], level + 1, suffix, depth))
      lines.push_back(std::move(line));
  }
  lines.push_back(indent + std::string(consts::kMapClose));
  return lines;
}

std::vector<std::string> pretty_at(std::string_view text, int depth) {
  const ansi::StyleWrapper wrapper = ansi::extract_wrappers(strutil::trim(text));
  const std::string_view content = wrapper.content;

  std::vector<std::string> lines;
  const Shape shape = depth < consts::kMaxDepth ? classify(content) : Shape{};
  switch (shape.kind) {
  case ShapeKind::Parenthesized:
    lines = pretty_at(shape.body, depth + 1);
    lines.front().insert(0, "(");
    lines.back().append(")");
    break;
  case ShapeKind::MapLiteral:
    lines = format_map(content, shape.body, 0, depth);
    break;
  case ShapeKind::CallSignature:
  case ShapeKind::Plain:
    lines.emplace_back(content);
    break;
  }
  ansi::reattach(lines, wrapper);
  return lines;
}

} // namespace

std::vector<std::string> pretty_multiline(std::string_view text) { return pretty_at(text, 0); }

} // namespace litdiff
