#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace litdiff {

enum class LineKind : std::uint8_t { Deletion, Insertion };

struct DiffLine {
  LineKind kind;
  std::string text; // marker included, ready to print
};

// Structural diff of expected vs actual literal text, given as lines.
// Tries, in order: map entries (one map per side), call signature
// `(args) :: return` (one line per side), Myers line diff. Never throws.
std::vector<DiffLine> diff_lines(const std::vector<std::string>& expected,
                                 const std::vector<std::string>& actual,
                                 bool color);

// Same as diff_lines with both texts split on newlines.
std::vector<DiffLine> diff_text(std::string_view expected, std::string_view actual,
                                bool color);

// Display lines for one rendered text: pretty-printed, marked with "-  " or
// "+  ", closed when it fits on one line, tinted red or green with color on.
std::vector<DiffLine> display_lines(LineKind kind, std::string_view text, bool color);

// Append the closers a line is missing (escape runs ignored).
std::string balance_line(std::string_view line);

std::vector<std::string> texts(const std::vector<DiffLine>& lines);

} // namespace litdiff
