#include "cli/commands.hpp"

#include <iostream>
#include <string_view>

namespace {

bool is_help(std::string_view arg) { return arg == "-h" || arg == "--help"; }

} // namespace

int main(int argc, char **argv) {
  // A subcommand is required; without one, show help as a usage error.
  if (argc < 2) {
    hoard::cli::print_help(std::cerr);
    return 2;
  }
  const std::string_view arg = argv[1];

  if (is_help(arg)) {
    hoard::cli::print_help(std::cout);
    return 0;
  }
  if (arg == "-V" || arg == "--version") {
    std::cout << "hoard " << HOARD_VERSION << "\n";
    return 0;
  }
  if (arg == "help") {
    if (argc < 3) {
      hoard::cli::print_help(std::cout);
      return 0;
    }
    if (const auto *cmd = hoard::cli::find_command(argv[2])) {
      hoard::cli::print_command_help(std::cout, *cmd);
      return 0;
    }
    std::cerr << "error: no such subcommand: '" << argv[2] << "'\n";
    return 2;
  }

  const auto *cmd = hoard::cli::find_command(arg);
  if (!cmd) {
    std::cerr << "error: no such subcommand: '" << arg << "'\n\n";
    hoard::cli::print_help(std::cerr);
    return 2;
  }
  if (argc > 2 && is_help(argv[2])) {
    hoard::cli::print_command_help(std::cout, *cmd);
    return 0;
  }
  return cmd->run(argc - 1, argv + 1);
}
