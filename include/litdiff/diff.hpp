#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace litdiff::diff {

enum class Op : char { Keep = '=', Delete = '-', Insert = '+' };

// Shortest edit script turning `a` into `b` (Myers O(ND)).
std::vector<Op> edit_script(const std::vector<std::string>& a,
                            const std::vector<std::string>& b);

// A maximal run of changed lines between two unchanged ones.
struct ChangeRun {
  std::vector<std::string> deleted;
  std::vector<std::string> inserted;
};

// Changed runs in order; unchanged lines are dropped.
std::vector<ChangeRun> change_runs(const std::vector<std::string>& a,
                                   const std::vector<std::string>& b);

// Utility to split raw text into lines (keeps newlines trimmed).
std::vector<std::string> split_lines(std::string_view text);

} // namespace litdiff::diff
