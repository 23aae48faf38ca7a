#include "cli/commands.hpp"
#include "hoard/repo.hpp"

#include <filesystem>
#include <iostream>

int cmd_init(int argc, char **argv) {
  try {
    const std::filesystem::path root = argc > 1 ? argv[1] : ".";
    const auto repo = hoard::Repository::init(root);
    std::cout << "Initialized new hoard repository in " << repo.root().string() << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}
