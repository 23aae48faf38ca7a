#include "cli/commands.hpp"
#include "hoard/repo.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;

int cmd_add(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: hoard add <path> [<path> ...]\n";
    return 2;
  }

  // Collect unique paths while preserving order
  std::vector<fs::path> paths;
  paths.reserve(static_cast<std::size_t>(argc) - 1);
  for (int i = 1; i < argc; ++i) {
    fs::path path = argv[i];
    if (std::ranges::find(paths, path) == paths.end()) {
      paths.push_back(std::move(path));
    }
  }

  try {
    const auto repo = hoard::Repository::discover(fs::current_path());
    for (const auto &r : repo.ingest_paths(paths)) {
      const char *what = r.new_object ? "add" : (r.relinked ? "link" : "keep");
      std::cout << what << ": " << fs::relative(r.path, repo.root()).string() << " -> " << r.name
                << " (" << r.hash.str().substr(0, 12) << ")\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "add: " << e.what() << "\n";
    return 1;
  }
}
