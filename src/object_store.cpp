#include "hoard/object_store.hpp"

#include "hoard/error.hpp"
#include "hoard/fs.hpp"

#include <system_error>

namespace stdfs = std::filesystem;

namespace hoard {

ObjectStore::ObjectStore(stdfs::path root) : root_(std::move(root)) {
  std::error_code ec;
  if (!stdfs::exists(root_, ec)) {
    return;
  }
  for (auto it = stdfs::recursive_directory_iterator(root_, ec);
       it != stdfs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec)
      throw io_error(root_, "scan object store failed", ec);
    if (it->is_symlink() || !it->is_regular_file())
      continue;
    const auto &p = it->path();
    insert(StoredObject{.path = p,
                        .hash = ContentHash::from_path_or_content(p),
                        .ino = fs::inode_of(p)});
  }
  if (ec)
    throw io_error(root_, "scan object store failed", ec);
}

stdfs::path ObjectStore::path_for(const ContentHash &hash) const {
  return root_ / hash.storage_path();
}

bool ObjectStore::contains(const ContentHash &hash) const { return find_by_hash(hash) != nullptr; }

const StoredObject *ObjectStore::find_by_ino(std::uint64_t ino) const {
  const auto it = by_ino_.find(ino);
  return it == by_ino_.end() ? nullptr : &*arena_[it->second];
}

const StoredObject *ObjectStore::find_by_hash(const ContentHash &hash) const {
  const auto it = by_hash_.find(hash);
  return it == by_hash_.end() ? nullptr : &*arena_[it->second];
}

ContentHash ObjectStore::ingest(const stdfs::path &source, bool *stored) {
  if (stored)
    *stored = false;
  const auto ino = fs::inode_of(source);
  if (const auto *object = find_by_ino(ino)) {
    return object->hash;
  }

  auto hash = ContentHash::compute(source);
  if (const auto it = by_hash_.find(hash); it != by_hash_.end()) {
    if (fs::exists(arena_[it->second]->path)) {
      return hash;
    }
    // Deleted behind our back: store this copy in its place.
    forget(it->second);
  }

  const auto dst = path_for(hash);
  fs::establish_link(source, dst);
  insert(StoredObject{.path = dst, .hash = hash, .ino = fs::inode_of(dst)});
  if (stored)
    *stored = true;
  return hash;
}

void ObjectStore::remove(const ContentHash &hash) {
  const auto it = by_hash_.find(hash);
  if (it == by_hash_.end()) {
    return;
  }
  const std::size_t slot = it->second;
  const auto path = arena_[slot]->path;
  forget(slot);
  std::error_code ec;
  stdfs::remove(path, ec);
  if (ec)
    throw io_error(path, "remove object failed", ec);
}

void ObjectStore::insert(StoredObject object) {
  if (const auto it = by_hash_.find(object.hash); it != by_hash_.end())
    forget(it->second);
  if (const auto it = by_ino_.find(object.ino); it != by_ino_.end())
    forget(it->second);

  const std::size_t slot = arena_.size();
  by_ino_[object.ino] = slot;
  by_hash_.emplace(object.hash, slot);
  arena_.emplace_back(std::move(object));
}

void ObjectStore::forget(std::size_t slot) {
  auto &object = arena_[slot];
  if (!object)
    return;
  by_ino_.erase(object->ino);
  by_hash_.erase(object->hash);
  object.reset();
}

} // namespace hoard
