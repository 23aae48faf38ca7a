#pragma once

#include <ostream>
#include <span>
#include <string_view>

// Subcommand entry points; argv[0] is the subcommand name.
int cmd_init(int argc, char **argv);
int cmd_add(int argc, char **argv);
int cmd_apply(int argc, char **argv);
int cmd_plan(int argc, char **argv);
int cmd_sync(int argc, char **argv);
int cmd_mv(int argc, char **argv);
int cmd_rm(int argc, char **argv);
int cmd_info(int argc, char **argv);
int cmd_ls(int argc, char **argv);
int cmd_manifest(int argc, char **argv);

namespace hoard::cli {

struct command {
  std::string_view name;
  int (*run)(int argc, char **argv);
  std::string_view args;
  std::string_view about;
};

// All subcommands, in the order `hoard --help` lists them.
std::span<const command> commands();
const command *find_command(std::string_view name);

void print_help(std::ostream &os);
void print_command_help(std::ostream &os, const command &cmd);

} // namespace hoard::cli
