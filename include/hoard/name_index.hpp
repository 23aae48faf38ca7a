#pragma once
#include "hoard/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hoard {

struct NamedObject {
  std::string           name; // unique, user-chosen
  std::filesystem::path path; // canonical target (the stored object)
  ContentHash           hash;
  std::uint64_t         ino;

  bool operator==(const NamedObject &) const = default;
};

// Snapshot of .hoard/objects/by-name: one symlink per object name.
class NameIndex {
public:
  NameIndex() = default;
  explicit NameIndex(std::vector<NamedObject> objects) : objects_(std::move(objects)) {}

  // Scan `by_name_dir`. Entries that are not symlinks are skipped; a symlink
  // whose target is gone throws Error{BrokenReference}.
  static NameIndex load(const std::filesystem::path &by_name_dir);

  // Create by_name_dir/<name> as a relative symlink to `target`.
  static void link_name(const std::filesystem::path &by_name_dir, std::string_view name,
                        const std::filesystem::path &target);

  // Throws Error{InvalidFormat} for names that cannot be a single path segment.
  static void validate_name(std::string_view name);

  // Derived views; duplicates resolve last-write-wins.
  [[nodiscard]] std::unordered_map<std::uint64_t, const NamedObject *> by_ino() const;
  [[nodiscard]] std::unordered_map<std::string, const NamedObject *> by_name() const;
  [[nodiscard]] std::unordered_map<ContentHash, const NamedObject *> by_hash() const;

  [[nodiscard]] const std::vector<NamedObject> &objects() const { return objects_; }

private:
  std::vector<NamedObject> objects_;
};

} // namespace hoard
