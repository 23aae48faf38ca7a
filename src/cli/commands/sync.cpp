#include "cli/commands.hpp"
#include "hoard/reconcile.hpp"
#include "hoard/repo.hpp"

#include <filesystem>
#include <iostream>

namespace {

void print_plan(const hoard::Plan &plan, bool verbose) {
  for (const auto &name : plan.unknown) {
    std::cerr << "warning: no such object '" << name << "'\n";
  }
  for (const auto &c : plan.changes) {
    if (c.kind == hoard::ChangeKind::Ignore && !verbose)
      continue;
    std::cout << hoard::to_string(c.kind) << ": " << c.path;
    if (c.kind == hoard::ChangeKind::Modify)
      std::cout << " (" << c.from->name << " -> " << c.to->name << ")";
    else if (c.to)
      std::cout << " (" << c.to->name << ")";
    else if (c.from)
      std::cout << " (" << c.from->name << ")";
    std::cout << "\n";
  }
}

} // namespace

// plan [manifest]: what sync would do, untracked files included
int cmd_plan(int argc, char **argv) {
  try {
    const auto repo = hoard::Repository::discover(std::filesystem::current_path());
    const std::filesystem::path manifest = argc > 1 ? argv[1] : repo.manifest_file();
    print_plan(repo.plan(manifest), true);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "plan: " << e.what() << "\n";
    return 1;
  }
}

int cmd_sync(int argc, char **argv) {
  try {
    const auto repo = hoard::Repository::discover(std::filesystem::current_path());
    const std::filesystem::path manifest = argc > 1 ? argv[1] : repo.manifest_file();
    print_plan(repo.sync(manifest), false);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "sync: " << e.what() << "\n";
    return 1;
  }
}
