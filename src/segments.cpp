#include "litdiff/segments.hpp"

#include "litdiff/ansi.hpp"
#include "litdiff/consts.hpp"
#include "litdiff/literal.hpp"
#include "litdiff/scanner.hpp"
#include "litdiff/util.hpp"

#include <vector>

namespace litdiff {

namespace {

bool module_char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
         c == '.' || c == '_' || c == '!';
}

// Move the closers `prefix + diff` still needs from the front of `suffix`
// into `diff`. Only whitespace may be crossed on the way.
void rebalance(const std::string &prefix, std::string &diff, std::string &suffix) {
  const std::string needed = unmatched_closers(prefix + diff);
  if (needed.empty())
    return;

  std::size_t pos = 0;
  std::size_t taken = 0;
  for (const char close : needed) {
    std::size_t q = pos;
    while (q < suffix.size() && strutil::is_space(suffix[q]))
      ++q;
    if (q == suffix.size() || suffix[q] != close)
      break;
    pos = q + 1;
    taken = pos;
  }
  if (taken == 0)
    return;
  diff += suffix.substr(0, taken);
  suffix.erase(0, taken);
}

// Closers both diffs end with go back to the suffixes.
void detach_shared_closers(DiffSegment &seg) {
  std::size_t n = 0;
  const std::string &e = seg.expected_diff;
  const std::string &a = seg.actual_diff;
  while (n < e.size() && n < a.size()) {
    const char ce = e[e.size() - 1 - n];
    if (ce != a[a.size() - 1 - n] || !is_closer(ce))
      break;
    ++n;
  }
  if (n == 0)
    return;
  const std::string shared = e.substr(e.size() - n);
  seg.expected_diff.resize(seg.expected_diff.size() - n);
  seg.actual_diff.resize(seg.actual_diff.size() - n);
  seg.expected_suffix.insert(0, shared);
  seg.actual_suffix.insert(0, shared);
}

struct Scope {
  bool is_struct = false;
  std::size_t brace = 0; // offset of the unmatched '{'
  std::string name;      // "%Name" for structures
  std::string key;
};

// Innermost '{' left open by `prefix`, when it opens a map or a named
// structure and the prefix already names the field being changed.
std::optional<Scope> innermost_scope(std::string_view prefix) {
  std::vector<std::size_t> open;
  for (const Token &tok : scan(prefix)) {
    if (tok.bracket != Bracket::Brace)
      continue;
    if (tok.kind == TokenKind::Open)
      open.push_back(tok.offset);
    else if (!open.empty())
      open.pop_back();
  }
  if (open.empty())
    return std::nullopt;

  Scope scope;
  scope.brace = open.back();
  if (scope.brace >= 1 && prefix[scope.brace - 1] == '%') {
    scope.is_struct = false;
  } else {
    std::size_t k = scope.brace;
    while (k > 0 && module_char(prefix[k - 1]))
      --k;
    if (k == scope.brace || k == 0 || prefix[k - 1] != '%')
      return std::nullopt;
    scope.is_struct = true;
    scope.name = std::string(prefix.substr(k - 1, scope.brace - k + 1));
  }

  // the segment the prefix ends in must already carry `key =>`
  const auto segments = split_top_level(prefix.substr(scope.brace + 1));
  if (segments.empty() || is_filler_segment(segments.back()))
    return std::nullopt;
  auto kv = split_key_value(segments.back());
  if (!kv || kv->first.empty())
    return std::nullopt;
  scope.key = std::move(kv->first);
  return scope;
}

struct Span {
  std::size_t begin;
  std::size_t end;
};

// Top-level segment of the body opened at `brace` that holds offset `pos`.
Span enclosing_segment(std::string_view text, std::size_t brace, std::size_t pos) {
  Depth depth;
  std::size_t begin = brace + 1;
  for (const Token &tok : scan(text)) {
    if (tok.offset <= brace)
      continue;
    const bool body_close =
        tok.kind == TokenKind::Close && tok.bracket == Bracket::Brace && depth.brace == 0;
    if (depth.top_level() && (tok.kind == TokenKind::Comma || body_close)) {
      if (tok.offset >= pos || body_close)
        return Span{begin, tok.offset};
      begin = tok.offset + 1;
      continue;
    }
    depth.apply(tok);
  }
  return Span{begin, text.size()};
}

} // namespace

std::string highlight(std::string_view text, bool color) {
  if (text.empty())
    return {};
  return ansi::colorize(text, ansi::Color::Yellow, color);
}

DiffSegment diff_segments(std::string_view expected, std::string_view actual, bool color) {
  DiffSegment seg;
  const std::size_t head = utf8::common_prefix(expected, actual);
  seg.prefix = std::string(expected.substr(0, head));

  const std::string_view rest_e = expected.substr(head);
  const std::string_view rest_a = actual.substr(head);
  const std::size_t tail = utf8::common_suffix(rest_e, rest_a);

  seg.expected_diff = std::string(rest_e.substr(0, rest_e.size() - tail));
  seg.expected_suffix = std::string(rest_e.substr(rest_e.size() - tail));
  seg.actual_diff = std::string(rest_a.substr(0, rest_a.size() - tail));
  seg.actual_suffix = std::string(rest_a.substr(rest_a.size() - tail));

  rebalance(seg.prefix, seg.expected_diff, seg.expected_suffix);
  rebalance(seg.prefix, seg.actual_diff, seg.actual_suffix);
  detach_shared_closers(seg);

  seg.highlighted_expected_diff = highlight(seg.expected_diff, color);
  seg.highlighted_actual_diff = highlight(seg.actual_diff, color);
  return seg;
}

std::optional<LinePair> compact_scope(const DiffSegment &seg, std::string_view expected,
                                      std::string_view actual, bool color) {
  const auto scope = innermost_scope(seg.prefix);
  if (!scope)
    return std::nullopt;

  // the change has to stay inside the field the prefix names
  const std::size_t pos = seg.prefix.size();
  const Span span_e = enclosing_segment(expected, scope->brace, pos);
  const Span span_a = enclosing_segment(actual, scope->brace, pos);
  if (expected.size() - seg.expected_suffix.size() > span_e.end ||
      actual.size() - seg.actual_suffix.size() > span_a.end)
    return std::nullopt;

  // both sides still hold that field under the same key
  const std::string_view entry_e =
      strutil::trim(expected.substr(span_e.begin, span_e.end - span_e.begin));
  const std::string_view entry_a =
      strutil::trim(actual.substr(span_a.begin, span_a.end - span_a.begin));
  const auto kv_e = split_key_value(entry_e);
  const auto kv_a = split_key_value(entry_a);
  if (!kv_e || !kv_a || kv_e->first != scope->key || kv_a->first != scope->key)
    return std::nullopt;

  const std::string field = scope->key + std::string(consts::kEntrySep);
  if (scope->is_struct) {
    const std::string head = "(" + scope->name + "{..., " + field;
    return LinePair{.expected = head + seg.highlighted_expected_diff + "})",
                    .actual = head + seg.highlighted_actual_diff + "})"};
  }

  const DiffSegment inner = diff_segments(entry_e, entry_a, color);
  const std::string head = "(" + std::string(consts::kMapOpen) + "..., " + field;
  return LinePair{.expected = head + inner.highlighted_expected_diff + "})",
                  .actual = head + inner.highlighted_actual_diff + "})"};
}

LinePair inline_pair(std::string_view expected, std::string_view actual, bool color) {
  const DiffSegment seg = diff_segments(expected, actual, color);
  if (auto compact = compact_scope(seg, expected, actual, color))
    return *compact;

  const std::string prefix = shrink_structs(seg.prefix);
  return LinePair{
      .expected = prefix + seg.highlighted_expected_diff + shrink_structs(seg.expected_suffix),
      .actual = prefix + seg.highlighted_actual_diff + shrink_structs(seg.actual_suffix)};
}

std::string shrink_structs(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '%') {
      std::size_t j = i + 1;
      while (j < text.size() && module_char(text[j]))
        ++j;
      if (j > i + 1 && j < text.size() && text[j] == '{') {
        const std::size_t close = matching_close(text, j);
        if (close != std::string_view::npos) {
          out.append(text.substr(i, j - i));
          out += "{...}";
          i = close + 1;
          continue;
        }
      }
    }
    out.push_back(text[i++]);
  }
  return out;
}

} // namespace litdiff
