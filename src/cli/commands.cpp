#include "cli/commands.hpp"

#include <algorithm>
#include <array>
#include <string>

namespace hoard::cli {

namespace {

constexpr std::string_view kAbout =
    "A command-line tool for organizing files using links.\n"
    "\n"
    "hoard keeps static files such as videos and ebooks in one place and lets\n"
    "you sort them with plain directories. Every file is stored once by its\n"
    "content; the same file can sit in several folders as hardlinks, and a\n"
    "JSON manifest describes where each object should appear.\n"
    "\n"
    "Use `init` to create a new hoard.";

constexpr std::array kCommands = {
    command{"init", ::cmd_init, "[dir]", "Creates a new hoard"},
    command{"add", ::cmd_add, "<path>...", "Adds files or directories to the hoard"},
    command{"mv", ::cmd_mv, "<old> <new>", "Renames an object"},
    command{"rm", ::cmd_rm, "<name>...", "Removes objects and all their links"},
    command{"apply", ::cmd_apply, "", "Drops links the manifest no longer lists"},
    command{"plan", ::cmd_plan, "[manifest]", "Shows what syncing to a manifest would change"},
    command{"sync", ::cmd_sync, "[manifest]", "Rearranges the tree to match a manifest"},
    command{"info", ::cmd_info, "<name|hash|path>", "Shows one object"},
    command{"ls", ::cmd_ls, "", "Lists all objects"},
    command{"manifest", ::cmd_manifest, "", "Prints the current layout as a manifest"},
};

} // namespace

std::span<const command> commands() { return kCommands; }

const command *find_command(std::string_view name) {
  const auto it = std::ranges::find(kCommands, name, &command::name);
  return it == kCommands.end() ? nullptr : &*it;
}

void print_help(std::ostream &os) {
  os << "hoard " << HOARD_VERSION << "\n" << kAbout << "\n\n";
  os << "USAGE:\n    hoard [-h | -V] <command> [args]\n\n";
  os << "COMMANDS:\n";
  std::size_t width = 0;
  for (const auto &c : kCommands)
    width = std::max(width, c.name.size());
  for (const auto &c : kCommands) {
    os << "    " << c.name << std::string(width - c.name.size() + 4, ' ') << c.about << "\n";
  }
}

void print_command_help(std::ostream &os, const command &cmd) {
  os << cmd.about << "\n\nUSAGE:\n    hoard " << cmd.name;
  if (!cmd.args.empty())
    os << " " << cmd.args;
  os << "\n";
}

} // namespace hoard::cli
