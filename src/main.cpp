#include "cli/registry.hpp"

int main(int argc, char **argv) {
  litdiff::cli::register_all_commands();
  return litdiff::cli::dispatch(argc, argv);
}
