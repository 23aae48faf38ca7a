#pragma once
#include "hoard/hash.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hoard {

struct StoredObject {
  std::filesystem::path path; // <store root>/ab/cdef...
  ContentHash           hash;
  std::uint64_t         ino;
};

// Content-addressed pool of hardlinks under one root directory.
// Objects live in an arena; by-inode and by-hash maps point into it by slot.
class ObjectStore {
public:
  // Scans `root` recursively; a missing root gives an empty store.
  explicit ObjectStore(std::filesystem::path root);

  // Register the content of `source`, returning its hash:
  //   1. inode already stored  -> that object's hash
  //   2. hash already stored   -> the hash (caller may relink source)
  //   3. otherwise             -> hardlink source into the store
  // `*stored` is set to whether a new file was linked into the store.
  ContentHash ingest(const std::filesystem::path &source, bool *stored = nullptr);

  [[nodiscard]] std::filesystem::path path_for(const ContentHash &hash) const;
  [[nodiscard]] bool contains(const ContentHash &hash) const;
  [[nodiscard]] const StoredObject *find_by_ino(std::uint64_t ino) const;
  [[nodiscard]] const StoredObject *find_by_hash(const ContentHash &hash) const;

  // Unlink the stored file and forget it. No error if it is not stored.
  void remove(const ContentHash &hash);

  [[nodiscard]] std::size_t size() const { return by_hash_.size(); }
  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

private:
  void insert(StoredObject object);
  void forget(std::size_t slot);

  std::filesystem::path root_;
  std::vector<std::optional<StoredObject>> arena_;
  std::unordered_map<std::uint64_t, std::size_t> by_ino_;
  std::unordered_map<ContentHash, std::size_t> by_hash_;
};

} // namespace hoard
