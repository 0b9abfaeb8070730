#include "cli/registry.hpp"

int cmd_diff(int argc, char **argv);
int cmd_pretty(int argc, char **argv);
int cmd_normalize(int argc, char **argv);
int cmd_print_config(int argc, char **argv);

namespace litdiff::cli {

void register_all_commands() {
  register_command({.name = "diff",
                    .fn = ::cmd_diff,
                    .synopsis = "[--inline] [--color|--no-color] [--config <path>] [--reason <text>] "
                                "<expected> <actual>",
                    .summary = "structural diff of two literals (files, or text with --inline)"});
  register_command({.name = "pretty",
                    .fn = ::cmd_pretty,
                    .synopsis = "[--inline] <file|text>",
                    .summary = "expand each literal line into an indented block"});
  register_command({.name = "normalize",
                    .fn = ::cmd_normalize,
                    .synopsis = "[--inline] <file|text>",
                    .summary = "print term lines with byte lists turned into strings"});
  register_command({.name = "print-config",
                    .fn = ::cmd_print_config,
                    .synopsis = "[--config <path>]",
                    .summary = "show the settings in effect"});
}

} // namespace litdiff::cli
