#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace litdiff {

// Optional external pretty-printer for raw term text (for instance one that
// rewrites raw runtime terms into literal syntax). Implementations may throw;
// callers fall back to the input text.
class TermPrettifier {
public:
  virtual ~TermPrettifier() = default;
  virtual std::string pretty_print(std::string_view text) const = 0;
};

// Term text -> display lines: optional helper pass, byte-list normalization,
// trimmed, split on newlines with empty lines dropped.
std::vector<std::string> format_term_lines(std::string_view text,
                                           const TermPrettifier* helper = nullptr);

} // namespace litdiff
