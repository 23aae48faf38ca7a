#pragma once
#include "hoard/consts.hpp"
#include "hoard/hash.hpp"
#include "hoard/manifest.hpp"
#include "hoard/name_index.hpp"
#include "hoard/reconcile.hpp"
#include "hoard/state.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hoard {

struct IngestReport {
  std::filesystem::path path;   // the ingested file
  ContentHash hash;
  std::string name;             // object name it is recorded under
  bool new_object;              // content was not stored before
  bool relinked;                // file was replaced by a link to the stored copy
};

struct Plan {
  std::vector<Change> changes;
  std::vector<std::string> unknown; // manifest names with no object
};

class Repository {
public:
  explicit Repository(std::filesystem::path root);

  // Create .hoard/{objects/by-hash,objects/by-name,manifest.json} under `root`.
  // Fails if a hoard already exists there.
  static Repository init(const std::filesystem::path &root);

  // Nearest directory at or above `start` holding .hoard.
  static Repository discover(const std::filesystem::path &start);

  // Core paths
  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] auto hoard_dir() const -> std::filesystem::path { return root_ / consts::kHoardDir; }
  [[nodiscard]] auto objects_dir() const -> std::filesystem::path {
    return hoard_dir() / consts::kObjectsDir;
  }
  [[nodiscard]] auto by_hash_dir() const -> std::filesystem::path {
    return objects_dir() / consts::kByHashDir;
  }
  [[nodiscard]] auto by_name_dir() const -> std::filesystem::path {
    return objects_dir() / consts::kByNameDir;
  }
  [[nodiscard]] auto manifest_file() const -> std::filesystem::path {
    return hoard_dir() / consts::kManifestFile;
  }

  [[nodiscard]] auto is_initialized() const -> bool;

  [[nodiscard]] NameIndex name_index() const;
  [[nodiscard]] Manifest manifest() const;

  // Store files (directories are expanded) and record where they live.
  // Every path must be inside the repository; nothing is touched otherwise.
  std::vector<IngestReport> ingest_paths(const std::vector<std::filesystem::path> &paths) const;

  // Delete redundant hardlinks of tracked objects that the manifest does not
  // list, then empty directories. Returns what was deleted.
  std::vector<std::filesystem::path> apply() const;

  // Changes needed to turn the working tree into the layout of `manifest_path`.
  [[nodiscard]] Plan plan(const std::filesystem::path &manifest_path) const;

  // Execute plan(manifest_path) and record it as the repository manifest.
  Plan sync(const std::filesystem::path &manifest_path) const;

  void rename(std::string_view old_name, std::string_view new_name) const;

  // Delete the object: its worktree links, name, stored copy and manifest entry.
  // While another name refers to the same content, the stored copy and the
  // worktree paths recorded for that name are kept.
  // Returns the deleted worktree paths.
  std::vector<std::filesystem::path> remove(std::string_view name) const;

  // Resolve a name, a 64-hex hash, or a path to a tracked file.
  [[nodiscard]] std::optional<NamedObject> lookup(std::string_view spec) const;

  // Tracked objects, sorted by name.
  [[nodiscard]] std::vector<NamedObject> objects() const;

  // Working-tree State of this repository.
  [[nodiscard]] State actual_state() const;

private:
  [[nodiscard]] std::vector<std::filesystem::path>
  expand(const std::vector<std::filesystem::path> &paths) const;
  [[nodiscard]] std::string relative(const std::filesystem::path &abs) const;
  [[nodiscard]] std::filesystem::path absolute_in_repo(const std::filesystem::path &p) const;

  std::filesystem::path root_;
};

} // namespace hoard
