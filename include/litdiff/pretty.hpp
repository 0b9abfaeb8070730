#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace litdiff {

// Expand a single-line literal into display lines:
//   "%{a => 1, b => %{c => 2, d => 3}}"
// becomes
//   %{
//     a => 1,
//     b => %{
//       c => 2,
//       d => 3
//     }
//   }
// Parenthesized text is expanded inside its parentheses. Maps with one entry
// (elision markers not counted) stay on one line. Leading and trailing escape
// runs end up on the first and last line.
std::vector<std::string> pretty_multiline(std::string_view text);

} // namespace litdiff
