#include "cli/commands.hpp"
#include "hoard/manifest.hpp"
#include "hoard/repo.hpp"

#include <filesystem>
#include <iostream>

int cmd_ls(int /*argc*/, char ** /*argv*/) {
  try {
    const auto repo = hoard::Repository::discover(std::filesystem::current_path());
    for (const auto &o : repo.objects())
      std::cout << o.hash.str().substr(0, 12) << "  " << o.name << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "ls: " << e.what() << "\n";
    return 1;
  }
}

// The working tree as it is now, in the format sync reads.
int cmd_manifest(int /*argc*/, char ** /*argv*/) {
  try {
    const auto repo = hoard::Repository::discover(std::filesystem::current_path());
    std::cout << hoard::dump_manifest(repo.actual_state().to_manifest());
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "manifest: " << e.what() << "\n";
    return 1;
  }
}
