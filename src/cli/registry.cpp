#include "cli/registry.hpp"

#include "litdiff/consts.hpp"

#include <iostream>
#include <utility>
#include <vector>

namespace litdiff::cli {

// Commands in registration order
static std::vector<Command> &commands() {
  static std::vector<Command> all;
  return all;
}

void register_command(Command cmd) { commands().push_back(std::move(cmd)); }

const Command *find_command(std::string_view name) {
  for (const auto &c : commands())
    if (c.name == name)
      return &c;
  return nullptr;
}

void print_usage(std::ostream &os) {
  os << "usage: litdiff <command> [args]\n\n";
  os << "commands:\n";
  for (const auto &c : commands())
    os << "  " << c.name << "  " << c.summary << "\n";
  os << "\nrun `litdiff help <command>` for its arguments\n";
}

int usage_error(std::string_view name) {
  if (const Command *c = find_command(name))
    std::cerr << "usage: litdiff " << c->name << " " << c->synopsis << "\n";
  else
    print_usage(std::cerr);
  return 2;
}

int dispatch(int argc, char **argv) {
  if (argc < 2) {
    print_usage(std::cerr);
    return 2;
  }
  const std::string_view cmd = argv[1];

  if (cmd == "help" || cmd == "--help" || cmd == "-h") {
    if (argc > 2) {
      const Command *c = find_command(argv[2]);
      if (!c)
        return usage_error(argv[2]);
      std::cout << "usage: litdiff " << c->name << " " << c->synopsis << "\n  " << c->summary
                << "\n";
      return 0;
    }
    print_usage(std::cout);
    return 0;
  }
  if (cmd == "--version") {
    std::cout << "litdiff " << consts::kVersion << "\n";
    return 0;
  }

  const Command *c = find_command(cmd);
  if (!c) {
    std::cerr << "unknown command: " << cmd << "\n";
    print_usage(std::cerr);
    return 2;
  }
  // the handler sees its own name as argv[0]
  return c->fn(argc - 1, argv + 1);
}

} // namespace litdiff::cli
