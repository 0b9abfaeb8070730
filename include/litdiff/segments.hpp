#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace litdiff {

// Split of an expected/actual pair around the part that differs.
//   prefix + expected_diff + expected_suffix == expected
//   prefix + actual_diff   + actual_suffix   == actual
struct DiffSegment {
  std::string prefix;
  std::string expected_diff;
  std::string actual_diff;
  std::string expected_suffix;
  std::string actual_suffix;

  // diffs with emphasis applied (equal to the raw diffs when color is off)
  std::string highlighted_expected_diff;
  std::string highlighted_actual_diff;

  std::string expected_line() const { return prefix + highlighted_expected_diff + expected_suffix; }
  std::string actual_line() const { return prefix + highlighted_actual_diff + actual_suffix; }
};

DiffSegment diff_segments(std::string_view expected, std::string_view actual, bool color);

// Emphasis for a differing run; empty text stays empty.
std::string highlight(std::string_view text, bool color);

struct LinePair {
  std::string expected;
  std::string actual;
};

// Elided rendering "(%Name{..., key => Δ})" or "(%{..., key => Δ})" when the
// change sits inside a named structure or a map field.
std::optional<LinePair> compact_scope(const DiffSegment& seg, std::string_view expected,
                                      std::string_view actual, bool color);

// Display pair for one changed line: the compacted form when there is one,
// otherwise the full lines with unchanged structures shortened.
LinePair inline_pair(std::string_view expected, std::string_view actual, bool color);

// %Name{...anything...} -> %Name{...} for every closed structure in `text`
std::string shrink_structs(std::string_view text);

} // namespace litdiff
