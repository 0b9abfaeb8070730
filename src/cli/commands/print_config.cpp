#include "litdiff/config.hpp"

#include "cli/registry.hpp"
#include "litdiff/consts.hpp"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

int cmd_print_config(int argc, char **argv) {
  std::filesystem::path config_path{litdiff::consts::kSettingsFile};
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else {
      return litdiff::cli::usage_error("print-config");
    }
  }

  try {
    const auto settings = litdiff::load_settings(config_path);
    std::cout << litdiff::format_settings(settings);
    const bool color = litdiff::resolve_color(settings.color, ::isatty(STDOUT_FILENO),
                                              std::getenv("NO_COLOR") != nullptr);
    std::cout << "# effective color: " << (color ? "on" : "off") << "\n";
  } catch (const std::exception &e) {
    std::cerr << "print-config: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
