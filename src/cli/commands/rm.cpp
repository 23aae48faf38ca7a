#include "cli/commands.hpp"
#include "hoard/repo.hpp"

#include <filesystem>
#include <iostream>

int cmd_rm(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: hoard rm <name> [<name> ...]\n";
    return 2;
  }
  try {
    const auto repo = hoard::Repository::discover(std::filesystem::current_path());
    for (int i = 1; i < argc; ++i) {
      for (const auto &p : repo.remove(argv[i]))
        std::cout << "delete: " << p.string() << "\n";
      std::cout << "remove: " << argv[i] << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "rm: " << e.what() << "\n";
    return 1;
  }
}
