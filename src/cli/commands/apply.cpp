#include "cli/commands.hpp"
#include "hoard/repo.hpp"

#include <filesystem>
#include <iostream>

int cmd_apply(int /*argc*/, char ** /*argv*/) {
  try {
    const auto repo = hoard::Repository::discover(std::filesystem::current_path());
    for (const auto &p : repo.apply()) {
      std::cout << "delete: " << p.string() << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "apply: " << e.what() << "\n";
    return 1;
  }
}
