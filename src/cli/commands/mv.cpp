#include "cli/commands.hpp"
#include "hoard/repo.hpp"

#include <filesystem>
#include <iostream>

int cmd_mv(int argc, char **argv) {
  if (argc != 3) {
    std::cerr << "usage: hoard mv <old-name> <new-name>\n";
    return 2;
  }
  try {
    const auto repo = hoard::Repository::discover(std::filesystem::current_path());
    repo.rename(argv[1], argv[2]);
    std::cout << "rename: " << argv[1] << " -> " << argv[2] << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "mv: " << e.what() << "\n";
    return 1;
  }
}
