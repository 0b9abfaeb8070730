#include "litdiff/differ.hpp"

#include "cli/registry.hpp"
#include "litdiff/config.hpp"
#include "litdiff/consts.hpp"
#include "litdiff/fs.hpp"
#include "litdiff/report.hpp"
#include "litdiff/term.hpp"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

static void print_lines(const std::vector<std::string> &lines) {
  for (const auto &line : lines)
    std::cout << line << "\n";
}

int cmd_diff(int argc, char **argv) {
  bool inline_text = false;
  std::optional<bool> color_flag;
  std::filesystem::path config_path{litdiff::consts::kSettingsFile};
  std::optional<std::string> reason;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--inline")
      inline_text = true;
    else if (a == "--color")
      color_flag = true;
    else if (a == "--no-color")
      color_flag = false;
    else if (a == "--config" && i + 1 < argc)
      config_path = argv[++i];
    else if (a == "--reason" && i + 1 < argc)
      reason = argv[++i];
    else if (a.starts_with("--")) {
      std::cerr << "diff: unknown option " << a << "\n";
      return litdiff::cli::usage_error("diff");
    } else
      args.push_back(a);
  }
  if (args.size() != 2)
    return litdiff::cli::usage_error("diff");

  try {
    const auto settings = litdiff::load_settings(config_path);
    const bool color = color_flag ? *color_flag
                                  : litdiff::resolve_color(settings.color, ::isatty(STDOUT_FILENO),
                                                           std::getenv("NO_COLOR") != nullptr);

    const auto expected = litdiff::format_term_lines(litdiff::fs::load_input(args[0], inline_text));
    const auto actual = litdiff::format_term_lines(litdiff::fs::load_input(args[1], inline_text));

    if (settings.header) {
      print_lines(litdiff::report::value_block("Expected", expected, color, litdiff::ansi::Color::Red));
      std::cout << "\n";
      print_lines(litdiff::report::value_block("Actual", actual, color, litdiff::ansi::Color::Green));
    }

    const auto lines = litdiff::texts(litdiff::diff_lines(expected, actual, color));
    if (lines.empty())
      std::cout << "(no differences)\n";
    else
      print_lines(litdiff::report::diff_section(lines, color));
    if (reason)
      print_lines(litdiff::report::reason_block(*reason));
  } catch (const std::exception &e) {
    std::cerr << "diff: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
