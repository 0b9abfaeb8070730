#include "litdiff/differ.hpp"

#include "litdiff/ansi.hpp"
#include "litdiff/binary.hpp"
#include "litdiff/consts.hpp"
#include "litdiff/diff.hpp"
#include "litdiff/literal.hpp"
#include "litdiff/pretty.hpp"
#include "litdiff/scanner.hpp"
#include "litdiff/segments.hpp"
#include "litdiff/util.hpp"

#include <algorithm>
#include <optional>

namespace litdiff {

namespace {

enum class Side : std::uint8_t { Expected, Actual };

using Lines = std::vector<DiffLine>;

void append(Lines &out, Lines more) {
  for (auto &line : more)
    out.push_back(std::move(line));
}

std::string entry_line(std::string_view key, std::string_view value) {
  std::string text(key);
  text += consts::kEntrySep;
  text += value;
  return binary::normalize(text);
}

std::string side_line(const DiffSegment &seg, Side side) {
  return side == Side::Expected ? seg.expected_line() : seg.actual_line();
}

// One side of a nested map pair: that side's keys in its own order, values
// that differ from the other side highlighted.
std::string render_map_value(std::string_view expected, std::string_view actual, bool color,
                             Side side, int depth) {
  const auto exp_entries = parse_map_literal(expected);
  const auto act_entries = parse_map_literal(actual);
  if (!exp_entries || !act_entries || depth >= consts::kMaxDepth)
    return side_line(diff_segments(expected, actual, color), side);

  const auto &own = side == Side::Expected ? *exp_entries : *act_entries;
  const auto &other = side == Side::Expected ? *act_entries : *exp_entries;

  std::string out(consts::kMapOpen);
  bool first = true;
  for (const Entry &entry : own) {
    const Entry *peer = find_entry(other, entry.key);
    std::string rendered;
    if (!peer) {
      rendered = highlight(entry.value, color);
    } else {
      const std::string &e = side == Side::Expected ? entry.value : peer->value;
      const std::string &a = side == Side::Expected ? peer->value : entry.value;
      if (is_map_literal(e) && is_map_literal(a))
        rendered = render_map_value(e, a, color, side, depth + 1);
      else
        rendered = side_line(diff_segments(e, a, color), side);
    }
    if (!first)
      out += ", ";
    first = false;
    out += entry.key;
    out += consts::kEntrySep;
    out += rendered;
  }
  out += consts::kMapClose;
  return out;
}

std::optional<Lines> diff_map_entries(const std::vector<std::string> &expected,
                                      const std::vector<std::string> &actual, bool color) {
  if (expected.size() != 1 || actual.size() != 1)
    return std::nullopt;
  const auto exp_entries = parse_map_literal(expected.front());
  if (!exp_entries)
    return std::nullopt;
  const auto act_entries = parse_map_literal(actual.front());
  if (!act_entries)
    return std::nullopt;

  std::vector<std::string> keys;
  for (const Entry &e : *exp_entries)
    keys.push_back(e.key);
  for (const Entry &a : *act_entries)
    if (!find_entry(*exp_entries, a.key))
      keys.push_back(a.key);

  Lines out;
  for (const std::string &key : keys) {
    const Entry *exp = find_entry(*exp_entries, key);
    const Entry *act = find_entry(*act_entries, key);
    if (exp && !act) {
      append(out, display_lines(LineKind::Deletion,
                                entry_line(key, highlight(exp->value, color)), color));
    } else if (!exp && act) {
      append(out, display_lines(LineKind::Insertion,
                                entry_line(key, highlight(act->value, color)), color));
    } else if (exp->value != act->value) {
      std::string del;
      std::string ins;
      if (is_map_literal(exp->value) && is_map_literal(act->value)) {
        del = render_map_value(exp->value, act->value, color, Side::Expected, 1);
        ins = render_map_value(exp->value, act->value, color, Side::Actual, 1);
      } else {
        const DiffSegment seg = diff_segments(exp->value, act->value, color);
        del = seg.expected_line();
        ins = seg.actual_line();
      }
      append(out, display_lines(LineKind::Deletion, entry_line(key, del), color));
      append(out, display_lines(LineKind::Insertion, entry_line(key, ins), color));
    }
  }
  return out;
}

std::optional<Lines> diff_call_signature(const std::vector<std::string> &expected,
                                         const std::vector<std::string> &actual, bool color) {
  if (expected.size() != 1 || actual.size() != 1)
    return std::nullopt;
  const Shape exp = classify(expected.front());
  const Shape act = classify(actual.front());
  if (exp.kind != ShapeKind::CallSignature || act.kind != ShapeKind::CallSignature)
    return std::nullopt;

  const DiffSegment args = diff_segments(exp.args, act.args, color);
  const DiffSegment ret = diff_segments(exp.ret, act.ret, color);

  Lines out;
  append(out, display_lines(LineKind::Deletion,
                            "(" + args.expected_line() + ") :: " + ret.expected_line(), color));
  append(out, display_lines(LineKind::Insertion,
                            "(" + args.actual_line() + ") :: " + ret.actual_line(), color));
  return out;
}

Lines diff_by_lines(const std::vector<std::string> &expected,
                    const std::vector<std::string> &actual, bool color) {
  Lines out;
  for (const auto &run : diff::change_runs(expected, actual)) {
    const std::size_t paired = std::min(run.deleted.size(), run.inserted.size());
    for (std::size_t i = 0; i < paired; ++i) {
      const LinePair pair = inline_pair(run.deleted[i], run.inserted[i], color);
      append(out, display_lines(LineKind::Deletion, pair.expected, color));
      append(out, display_lines(LineKind::Insertion, pair.actual, color));
    }
    for (std::size_t i = paired; i < run.deleted.size(); ++i)
      append(out, display_lines(LineKind::Deletion, run.deleted[i], color));
    for (std::size_t i = paired; i < run.inserted.size(); ++i)
      append(out, display_lines(LineKind::Insertion, run.inserted[i], color));
  }
  return out;
}

} // namespace

std::string balance_line(std::string_view line) {
  std::string out(line);
  out += unmatched_closers(ansi::strip(line));
  return out;
}

std::vector<DiffLine> display_lines(LineKind kind, std::string_view text, bool color) {
  const std::string_view marker =
      kind == LineKind::Deletion ? consts::kDelMarker : consts::kInsMarker;
  const ansi::Color tint = kind == LineKind::Deletion ? ansi::Color::Red : ansi::Color::Green;
  const std::string indent(consts::kMarkerWidth, ' ');

  const auto pretty = pretty_multiline(text);
  std::vector<DiffLine> out;
  out.reserve(pretty.size());
  for (std::size_t i = 0; i < pretty.size(); ++i) {
    std::string line = (i == 0 ? std::string(marker) : indent) + pretty[i];
    if (pretty.size() == 1)
      line = balance_line(line);
    out.push_back(DiffLine{.kind = kind, .text = ansi::colorize(line, tint, color)});
  }
  return out;
}

std::vector<DiffLine> diff_lines(const std::vector<std::string> &expected,
                                 const std::vector<std::string> &actual, bool color) {
  if (auto lines = diff_map_entries(expected, actual, color))
    return std::move(*lines);
  if (auto lines = diff_call_signature(expected, actual, color))
    return std::move(*lines);
  return diff_by_lines(expected, actual, color);
}

std::vector<DiffLine> diff_text(std::string_view expected, std::string_view actual, bool color) {
  return diff_lines(diff::split_lines(expected), diff::split_lines(actual), color);
}

std::vector<std::string> texts(const std::vector<DiffLine> &lines) {
  std::vector<std::string> out;
  out.reserve(lines.size());
  for (const auto &line : lines)
    out.push_back(line.text);
  return out;
}

} // namespace litdiff
