#pragma once
#include <iosfwd>
#include <string>
#include <string_view>
#include "cli/command.hpp"

namespace litdiff::cli {

struct Command {
  std::string name;
  command_fn fn;
  std::string synopsis; // arguments after the command name
  std::string summary;
};

void register_command(Command cmd);
const Command* find_command(std::string_view name);

void print_usage(std::ostream& os);

// Print the synopsis of `name` on stderr; returns the usage exit status (2)
int usage_error(std::string_view name);

// Run argv[1] with the remaining arguments
int dispatch(int argc, char** argv);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace litdiff::cli
