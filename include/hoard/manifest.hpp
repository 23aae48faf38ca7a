#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace hoard {

// name -> paths where that object should appear (repo-relative, in file order).
//
//   {
//     "item-name-1": ["path1/item-name-1", "path2/item-name-1"],
//     "item-name-2": ["path1/item-name-2", "path3/item-name-2"]
//   }
using Manifest = std::map<std::string, std::vector<std::string>>;

// Throws Error{Io} if unreadable, Error{InvalidFormat} if not a JSON object of
// string arrays.
Manifest load_manifest(const std::filesystem::path &file);
Manifest parse_manifest(const std::string &text);

std::string dump_manifest(const Manifest &manifest);
void save_manifest(const std::filesystem::path &file, const Manifest &manifest);

} // namespace hoard
