#include "hoard/repo.hpp"

#include "hoard/consts.hpp"
#include "hoard/error.hpp"
#include "hoard/fs.hpp"
#include "hoard/object_store.hpp"
#include "hoard/state.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace stdfs = std::filesystem;

namespace {

// Visit every regular file of the working tree (symlinks and .hoard skipped).
void walk_worktree(const stdfs::path &root,
                   const std::function<void(const stdfs::path &)> &visit) {
  std::error_code ec;
  for (auto it = stdfs::recursive_directory_iterator(root, ec);
       it != stdfs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec)
      throw hoard::io_error(root, "walk failed", ec);
    const auto &p = it->path();
    if (p.filename() == hoard::consts::kHoardDir) {
      it.disable_recursion_pending();
      continue;
    }
    if (it->is_symlink() || !it->is_regular_file())
      continue;
    visit(p);
  }
  if (ec)
    throw hoard::io_error(root, "walk failed", ec);
}

std::string unique_name(const std::string &base, const std::unordered_set<std::string> &taken) {
  if (!taken.contains(base))
    return base;
  for (int n = 2;; ++n) {
    auto candidate = base + hoard::consts::kNameSuffixSep + std::to_string(n);
    if (!taken.contains(candidate))
      return candidate;
  }
}

} // namespace

namespace hoard {

Repository::Repository(stdfs::path root) {
  std::error_code ec;
  root_ = stdfs::weakly_canonical(stdfs::absolute(root), ec);
  if (ec)
    throw io_error(root, "resolve repository root failed", ec);
}

auto Repository::is_initialized() const -> bool {
  std::error_code ec;
  return stdfs::is_directory(hoard_dir(), ec);
}

Repository Repository::init(const stdfs::path &root) {
  Repository repo{root};
  if (repo.is_initialized()) {
    throw Error{ErrorKind::Io, "a hoard repository already exists", repo.hoard_dir()};
  }

  std::error_code ec;
  stdfs::create_directories(repo.by_hash_dir(), ec);
  if (ec)
    throw io_error(repo.by_hash_dir(), "create objects dir failed", ec);
  stdfs::create_directories(repo.by_name_dir(), ec);
  if (ec)
    throw io_error(repo.by_name_dir(), "create names dir failed", ec);

  save_manifest(repo.manifest_file(), Manifest{});
  return repo;
}

Repository Repository::discover(const stdfs::path &start) {
  std::error_code ec;
  auto cur = stdfs::weakly_canonical(stdfs::absolute(start), ec);
  if (ec)
    throw io_error(start, "resolve failed", ec);

  for (;;) {
    if (stdfs::is_directory(cur / consts::kHoardDir, ec))
      return Repository{cur};
    if (!cur.has_relative_path())
      break;
    cur = cur.parent_path();
  }
  throw Error{ErrorKind::RepositoryNotFound, "no hoard repository found", start};
}

NameIndex Repository::name_index() const { return NameIndex::load(by_name_dir()); }

Manifest Repository::manifest() const {
  if (!fs::exists(manifest_file()))
    return {};
  return load_manifest(manifest_file());
}

State Repository::actual_state() const { return State::from_filesystem(root_, name_index()); }

std::string Repository::relative(const stdfs::path &abs) const {
  return abs.lexically_relative(root_).generic_string();
}

stdfs::path Repository::absolute_in_repo(const stdfs::path &p) const {
  std::error_code ec;
  auto abs = stdfs::weakly_canonical(stdfs::absolute(p), ec);
  if (ec)
    throw io_error(p, "resolve failed", ec);
  if (!fs::is_within(root_, abs)) {
    throw Error{ErrorKind::PathOutsideRepository, "pathspec is not inside of hoard repository",
                abs};
  }
  if (fs::is_within(hoard_dir(), abs)) {
    throw Error{ErrorKind::PathOutsideRepository, "pathspec is inside the hoard's own storage",
                abs};
  }
  return abs;
}

std::vector<stdfs::path> Repository::expand(const std::vector<stdfs::path> &paths) const {
  // Resolve everything first so a bad path aborts before anything changes.
  std::vector<stdfs::path> resolved;
  resolved.reserve(paths.size());
  for (const auto &p : paths)
    resolved.push_back(absolute_in_repo(p));

  std::vector<stdfs::path> files;
  std::set<stdfs::path> seen;
  auto push = [&](const stdfs::path &f) {
    if (seen.insert(f).second)
      files.push_back(f);
  };

  for (const auto &p : resolved) {
    std::error_code ec;
    const auto st = stdfs::symlink_status(p, ec);
    if (stdfs::is_directory(st)) {
      std::vector<stdfs::path> found;
      walk_worktree(p, [&](const stdfs::path &f) { found.push_back(f); });
      std::ranges::sort(found);
      for (const auto &f : found)
        push(f);
    } else if (stdfs::is_regular_file(st)) {
      push(p);
    } else {
      throw Error{ErrorKind::Io, "pathspec did not match any files", p};
    }
  }
  return files;
}

std::vector<IngestReport> Repository::ingest_paths(const std::vector<stdfs::path> &paths) const {
  const auto files = expand(paths);

  ObjectStore store{by_hash_dir()};
  const auto index = name_index();

  std::unordered_map<ContentHash, std::string> names;
  std::unordered_set<std::string> taken;
  for (const auto &o : index.objects()) {
    names.insert_or_assign(o.hash, o.name);
    taken.insert(o.name);
  }

  Manifest recorded = manifest();
  std::vector<IngestReport> reports;
  reports.reserve(files.size());

  for (const auto &file : files) {
    bool new_object = false;
    auto hash = store.ingest(file, &new_object);

    const auto *stored = store.find_by_hash(hash);
    bool relinked = false;
    if (stored && stored->ino != fs::inode_of(file)) {
      fs::establish_link(stored->path, file);
      relinked = true;
    }

    auto named = names.find(hash);
    if (named == names.end()) {
      auto name = unique_name(file.filename().string(), taken);
      NameIndex::link_name(by_name_dir(), name, store.path_for(hash));
      taken.insert(name);
      named = names.emplace(hash, std::move(name)).first;
    }

    auto rel = relative(file);
    auto &listed = recorded[named->second];
    if (std::ranges::find(listed, rel) == listed.end())
      listed.push_back(rel);

    reports.push_back(IngestReport{.path = file,
                                   .hash = std::move(hash),
                                   .name = named->second,
                                   .new_object = new_object,
                                   .relinked = relinked});
  }

  save_manifest(manifest_file(), recorded);
  return reports;
}

std::vector<stdfs::path> Repository::apply() const {
  const auto index = name_index();
  const auto by_ino = index.by_ino();
  const auto recorded = manifest();

  std::map<std::uint64_t, std::vector<std::string>> tracked; // ino -> worktree paths
  walk_worktree(root_, [&](const stdfs::path &p) {
    const auto ino = fs::inode_of(p);
    if (by_ino.contains(ino))
      tracked[ino].push_back(relative(p));
  });

  std::vector<std::string> redundant;
  for (const auto &[ino, paths] : tracked) {
    if (paths.size() < 2)
      continue;
    std::set<std::string> listed;
    if (const auto it = recorded.find(by_ino.at(ino)->name); it != recorded.end()) {
      for (const auto &p : it->second)
        listed.insert(normalize_relative(p));
    }
    const bool anchored =
        std::ranges::any_of(paths, [&](const std::string &p) { return listed.contains(p); });
    if (!anchored)
      continue; // never delete the last expected reference
    for (const auto &p : paths)
      if (!listed.contains(p))
        redundant.push_back(p);
  }
  std::ranges::sort(redundant);

  std::vector<stdfs::path> deleted;
  for (const auto &rel : redundant) {
    fs::remove_file(root_ / rel);
    deleted.push_back(root_ / rel);
  }
  for (auto &dir : fs::prune_empty_dirs(root_, hoard_dir()))
    deleted.push_back(dir / "");
  return deleted;
}

Plan Repository::plan(const stdfs::path &manifest_path) const {
  const auto index = name_index();
  std::unordered_set<std::string> known;
  for (const auto &o : index.objects())
    known.insert(o.name);

  const auto desired = State::from_manifest(manifest_path, known);
  const auto actual = State::from_filesystem(root_, index);
  return Plan{.changes = reconcile(desired, actual, index), .unknown = desired.unknown};
}

Plan Repository::sync(const stdfs::path &manifest_path) const {
  const auto index = name_index();
  std::unordered_set<std::string> known;
  for (const auto &o : index.objects())
    known.insert(o.name);

  const auto desired = State::from_manifest(manifest_path, known);
  const auto actual = State::from_filesystem(root_, index);
  Plan result{.changes = reconcile(desired, actual, index), .unknown = desired.unknown};

  ChangeExecutor{root_}.execute_all(result.changes);
  fs::prune_empty_dirs(root_, hoard_dir());

  // Record the layout of every name that took part in the reconciliation.
  Manifest recorded = manifest();
  for (const auto &[name, paths] : desired.paths) {
    if (actual.paths.contains(name))
      recorded[name] = std::vector<std::string>(paths.begin(), paths.end());
  }
  save_manifest(manifest_file(), recorded);
  return result;
}

void Repository::rename(std::string_view old_name, std::string_view new_name) const {
  NameIndex::validate_name(new_name);
  const auto index = name_index();
  const auto by_name = index.by_name();
  if (!by_name.contains(std::string(old_name))) {
    throw Error{ErrorKind::InvalidFormat, "no such object '" + std::string(old_name) + "'"};
  }
  if (by_name.contains(std::string(new_name))) {
    throw Error{ErrorKind::InvalidFormat, "name already taken '" + std::string(new_name) + "'"};
  }

  const auto from = by_name_dir() / std::string(old_name);
  const auto to = by_name_dir() / std::string(new_name);
  std::error_code ec;
  stdfs::rename(from, to, ec);
  if (ec)
    throw io_error(from, "rename failed", ec);

  Manifest recorded = manifest();
  if (auto node = recorded.extract(std::string(old_name))) {
    node.key() = std::string(new_name);
    recorded.insert(std::move(node));
    save_manifest(manifest_file(), recorded);
  }
}

std::vector<stdfs::path> Repository::remove(std::string_view name) const {
  const auto index = name_index();
  const auto by_name = index.by_name();
  const auto it = by_name.find(std::string(name));
  if (it == by_name.end()) {
    throw Error{ErrorKind::InvalidFormat, "no such object '" + std::string(name) + "'"};
  }
  const NamedObject object = *it->second;

  Manifest recorded = manifest();

  // Worktree paths recorded for other names on the same object stay.
  bool shared = false;
  std::set<std::string> kept;
  for (const auto &o : index.objects()) {
    if (o.name == object.name || o.hash != object.hash)
      continue;
    shared = true;
    if (const auto listed = recorded.find(o.name); listed != recorded.end()) {
      for (const auto &p : listed->second)
        kept.insert(normalize_relative(p));
    }
  }

  std::vector<stdfs::path> links;
  walk_worktree(root_, [&](const stdfs::path &p) {
    if (fs::inode_of(p) == object.ino && !kept.contains(relative(p)))
      links.push_back(p);
  });
  std::ranges::sort(links);
  for (const auto &p : links)
    fs::remove_file(p);

  fs::remove_file(by_name_dir() / object.name);

  if (!shared) {
    ObjectStore store{by_hash_dir()};
    store.remove(object.hash);
  }

  if (recorded.erase(object.name) > 0)
    save_manifest(manifest_file(), recorded);

  fs::prune_empty_dirs(root_, hoard_dir());
  return links;
}

std::optional<NamedObject> Repository::lookup(std::string_view spec) const {
  const auto index = name_index();
  if (const auto by_name = index.by_name(); by_name.contains(std::string(spec)))
    return *by_name.at(std::string(spec));

  if (const auto hash = ContentHash::try_parse(spec)) {
    const auto by_hash = index.by_hash();
    if (const auto it = by_hash.find(*hash); it != by_hash.end())
      return *it->second;
    return std::nullopt;
  }

  const stdfs::path p{std::string(spec)};
  if (!fs::exists(p))
    return std::nullopt;
  const auto by_ino = index.by_ino();
  if (const auto it = by_ino.find(fs::inode_of(p)); it != by_ino.end())
    return *it->second;
  return std::nullopt;
}

std::vector<NamedObject> Repository::objects() const {
  auto out = name_index().objects();
  std::ranges::sort(out, [](const NamedObject &a, const NamedObject &b) { return a.name < b.name; });
  return out;
}

} // namespace hoard
