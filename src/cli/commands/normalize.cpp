#include "litdiff/term.hpp"

#include "cli/registry.hpp"
#include "litdiff/fs.hpp"

#include <iostream>
#include <string>

int cmd_normalize(int argc, char **argv) {
  bool inline_text = false;
  std::string input;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--inline")
      inline_text = true;
    else if (input.empty())
      input = a;
  }
  if (input.empty())
    return litdiff::cli::usage_error("normalize");

  try {
    for (const auto &line : litdiff::format_term_lines(litdiff::fs::load_input(input, inline_text)))
      std::cout << line << "\n";
  } catch (const std::exception &e) {
    std::cerr << "normalize: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
