#include "hoard/state.hpp"

#include "hoard/consts.hpp"
#include "hoard/error.hpp"
#include "hoard/fs.hpp"

#include <sstream>
#include <system_error>

namespace stdfs = std::filesystem;

namespace hoard {

std::string normalize_relative(const std::string &path) {
  const stdfs::path p{path};
  if (p.empty() || p.is_absolute()) {
    throw Error{ErrorKind::PathOutsideRepository, "manifest paths must be relative", p};
  }
  auto n = p.lexically_normal();
  if (!n.has_filename())
    n = n.parent_path();
  if (n.empty() || n == "." || *n.begin() == "..") {
    throw Error{ErrorKind::PathOutsideRepository, "manifest path leaves the repository", p};
  }
  return n.generic_string();
}

State State::from_manifest(const Manifest &manifest,
                           const std::unordered_set<std::string> &known_names) {
  State state;
  for (const auto &[name, paths] : manifest) {
    if (!known_names.contains(name)) {
      state.unknown.push_back(name);
      continue;
    }
    auto &out = state.paths[name];
    for (const auto &p : paths)
      out.insert(normalize_relative(p));
  }

  std::map<std::string, std::set<std::string>> claimants;
  for (const auto &[name, paths] : state.paths)
    for (const auto &p : paths)
      claimants[p].insert(name);

  std::ostringstream dupes;
  bool ambiguous = false;
  for (const auto &[path, names] : claimants) {
    if (names.size() < 2)
      continue;
    dupes << (ambiguous ? "; " : "") << path << " <- ";
    bool first = true;
    for (const auto &n : names) {
      dupes << (first ? "" : ", ") << n;
      first = false;
    }
    ambiguous = true;
  }
  if (ambiguous) {
    throw Error{ErrorKind::AmbiguousManifest, "duplicate paths for entries: " + dupes.str()};
  }
  return state;
}

State State::from_manifest(const stdfs::path &file,
                           const std::unordered_set<std::string> &known_names) {
  return from_manifest(load_manifest(file), known_names);
}

State State::from_filesystem(const stdfs::path &root, const NameIndex &index) {
  State state;
  const auto by_ino = index.by_ino();

  std::error_code ec;
  for (auto it = stdfs::recursive_directory_iterator(root, ec);
       it != stdfs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec)
      throw io_error(root, "walk failed", ec);
    const auto &p = it->path();
    if (p.filename() == consts::kHoardDir) {
      it.disable_recursion_pending();
      continue;
    }
    if (it->is_symlink() || !it->is_regular_file()) {
      continue;
    }
    auto rel = p.lexically_relative(root).generic_string();
    if (const auto found = by_ino.find(fs::inode_of(p)); found != by_ino.end()) {
      state.paths[found->second->name].insert(std::move(rel));
    } else {
      state.extra.insert(std::move(rel));
    }
  }
  if (ec)
    throw io_error(root, "walk failed", ec);
  return state;
}

Manifest State::to_manifest() const {
  Manifest m;
  for (const auto &[name, set] : paths)
    m[name] = std::vector<std::string>(set.begin(), set.end());
  return m;
}

} // namespace hoard
