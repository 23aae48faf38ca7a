#pragma once
#include "hoard/manifest.hpp"
#include "hoard/name_index.hpp"

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace hoard {

/**
 * Layout of a hoard seen through its name index: for each object name, the set
 * of repo-relative paths holding it, plus paths holding unknown content.
 *
 * Built either from a manifest (what should exist) or from the working tree
 * (what does exist), so the two can be reconciled.
 */
struct State {
  std::map<std::string, std::set<std::string>> paths;
  std::set<std::string> extra;
  std::vector<std::string> unknown; // manifest names the index does not know

  // Names absent from `known_names` are dropped into `unknown`. A path listed
  // under two names throws Error{AmbiguousManifest}; absolute or escaping paths
  // throw Error{PathOutsideRepository}.
  static State from_manifest(const Manifest &manifest,
                             const std::unordered_set<std::string> &known_names);
  static State from_manifest(const std::filesystem::path &file,
                             const std::unordered_set<std::string> &known_names);

  // Walk regular files under `root`, skipping .hoard.
  static State from_filesystem(const std::filesystem::path &root, const NameIndex &index);

  [[nodiscard]] Manifest to_manifest() const;
};

// Lexically normalize a manifest path; throws if it is absolute or leaves the root.
std::string normalize_relative(const std::string &path);

} // namespace hoard
