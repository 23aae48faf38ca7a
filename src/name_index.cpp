#include "hoard/name_index.hpp"

#include "hoard/error.hpp"
#include "hoard/fs.hpp"

#include <system_error>

namespace stdfs = std::filesystem;

namespace hoard {

NameIndex NameIndex::load(const stdfs::path &by_name_dir) {
  std::vector<NamedObject> objects;
  std::error_code ec;
  if (!stdfs::exists(by_name_dir, ec)) {
    return NameIndex{};
  }

  for (auto it = stdfs::directory_iterator(by_name_dir, ec); it != stdfs::directory_iterator();
       it.increment(ec)) {
    if (ec)
      throw io_error(by_name_dir, "scan name index failed", ec);
    if (!it->is_symlink())
      continue;

    const auto &ref = it->path();
    auto target = stdfs::canonical(ref, ec);
    if (ec) {
      if (ec == std::errc::no_such_file_or_directory)
        throw Error{ErrorKind::BrokenReference, "reference does not lead to an object", ref};
      throw io_error(ref, "resolve reference failed", ec);
    }

    auto hash = ContentHash::from_path_or_content(target);
    const auto ino = fs::inode_of(target);
    objects.push_back(NamedObject{.name = ref.filename().string(),
                                  .path = std::move(target),
                                  .hash = std::move(hash),
                                  .ino = ino});
  }
  if (ec)
    throw io_error(by_name_dir, "scan name index failed", ec);
  return NameIndex{std::move(objects)};
}

void NameIndex::validate_name(std::string_view name) {
  if (name.empty() || name == "." || name == ".." || name.find('/') != std::string_view::npos ||
      name.find('\0') != std::string_view::npos) {
    throw Error{ErrorKind::InvalidFormat, "invalid object name: '" + std::string(name) + "'"};
  }
}

void NameIndex::link_name(const stdfs::path &by_name_dir, std::string_view name,
                          const stdfs::path &target) {
  validate_name(name);
  const auto ref = by_name_dir / std::string(name);
  std::error_code ec;
  stdfs::create_directories(by_name_dir, ec);
  if (ec)
    throw io_error(by_name_dir, "mkdir -p failed", ec);

  const auto abs_dir = stdfs::weakly_canonical(by_name_dir, ec);
  if (ec)
    throw io_error(by_name_dir, "resolve failed", ec);
  const auto abs_target = stdfs::weakly_canonical(target, ec);
  if (ec)
    throw io_error(target, "resolve failed", ec);

  stdfs::create_symlink(abs_target.lexically_relative(abs_dir), ref, ec);
  if (ec)
    throw io_error(ref, "create reference failed", ec);
}

std::unordered_map<std::uint64_t, const NamedObject *> NameIndex::by_ino() const {
  std::unordered_map<std::uint64_t, const NamedObject *> m;
  for (const auto &o : objects_)
    m[o.ino] = &o;
  return m;
}

std::unordered_map<std::string, const NamedObject *> NameIndex::by_name() const {
  std::unordered_map<std::string, const NamedObject *> m;
  for (const auto &o : objects_)
    m[o.name] = &o;
  return m;
}

std::unordered_map<ContentHash, const NamedObject *> NameIndex::by_hash() const {
  std::unordered_map<ContentHash, const NamedObject *> m;
  for (const auto &o : objects_)
    m.insert_or_assign(o.hash, &o);
  return m;
}

} // namespace hoard
