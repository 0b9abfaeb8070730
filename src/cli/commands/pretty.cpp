#include "litdiff/pretty.hpp"

#include "cli/registry.hpp"
#include "litdiff/diff.hpp"
#include "litdiff/fs.hpp"

#include <iostream>
#include <string>

int cmd_pretty(int argc, char **argv) {
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
    return litdiff::cli::usage_error("pretty");

  try {
    const auto text = litdiff::fs::load_input(input, inline_text);
    // every input line is expanded on its own
    for (const auto &line : litdiff::diff::split_lines(text))
      for (const auto &out : litdiff::pretty_multiline(line))
        std::cout << out << "\n";
  } catch (const std::exception &e) {
    std::cerr << "pretty: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
