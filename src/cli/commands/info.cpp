#include "cli/commands.hpp"
#include "hoard/repo.hpp"

#include <filesystem>
#include <iostream>

int cmd_info(int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: hoard info <name | hash | path>\n";
    return 2;
  }
  try {
    const auto repo = hoard::Repository::discover(std::filesystem::current_path());
    const auto object = repo.lookup(argv[1]);
    if (!object) {
      std::cerr << "info: no such object: " << argv[1] << "\n";
      return 1;
    }
    std::cout << "name:  " << object->name << "\n";
    std::cout << "hash:  " << object->hash.str() << "\n";
    std::cout << "inode: " << object->ino << "\n";
    std::cout << "links: " << std::filesystem::hard_link_count(object->path) << "\n";

    const auto state = repo.actual_state();
    if (const auto it = state.paths.find(object->name); it != state.paths.end()) {
      for (const auto &p : it->second)
        std::cout << "  " << p << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "info: " << e.what() << "\n";
    return 1;
  }
}
