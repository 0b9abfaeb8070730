#include "litdiff/report.hpp"

#include <iostream>
#include <string>
#include <vector>

int main() {
  using namespace litdiff::report;
  using Lines = std::vector<std::string>;

  if (value_block("Expected", {"a", "b"}, false) != Lines{"Expected:", "  a", "  b"}) {
    std::cerr << "value_block\n";
    return 1;
  }
  if (!value_block("Actual", {}, true).empty()) {
    std::cerr << "value_block with no lines\n";
    return 1;
  }
  if (value_block("Expected", {"x"}, true, litdiff::ansi::Color::Red).front() !=
      "\x1b[31mExpected:\x1b[0m") {
    std::cerr << "tinted label\n";
    return 1;
  }

  if (diff_section({"-  x", "+  y"}, false) !=
      Lines{"", "Diff (expected -, actual +):", "    -  x", "    +  y"}) {
    std::cerr << "diff_section\n";
    return 1;
  }
  if (diff_section({"-  x"}, true)[1] != "\x1b[33mDiff (expected -, actual +):\x1b[0m") {
    std::cerr << "colored heading\n";
    return 1;
  }
  if (!diff_section({}, false).empty()) {
    std::cerr << "empty diff section\n";
    return 1;
  }

  if (reason_block("  -> will never return\n") != Lines{"", "Reason:", "  will never return"}) {
    std::cerr << "reason_block\n";
    return 1;
  }
  if (clean_reason("no arrow") != "no arrow") {
    std::cerr << "clean_reason without arrow\n";
    return 1;
  }

  std::cout << "report OK\n";
  return 0;
}
