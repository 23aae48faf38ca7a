#include "hoard/reconcile.hpp"

#include "hoard/error.hpp"
#include "hoard/fs.hpp"

#include <map>
#include <system_error>

namespace stdfs = std::filesystem;

namespace hoard {

std::string_view to_string(ChangeKind kind) {
  switch (kind) {
  case ChangeKind::Ignore:
    return "ignore";
  case ChangeKind::Create:
    return "create";
  case ChangeKind::Delete:
    return "delete";
  case ChangeKind::Modify:
    return "modify";
  }
  return "?";
}

namespace {

// Everything proposed for one path before merging.
struct PathSlot {
  bool ignore = false;
  std::vector<const NamedObject *> creates;
  std::vector<const NamedObject *> deletes;
};

} // namespace

std::vector<Change> reconcile(const State &desired, const State &actual, const NameIndex &index) {
  const auto objects = index.by_name();

  std::map<std::string, PathSlot> slots;
  for (const auto &[name, wanted] : desired.paths) {
    const auto have = actual.paths.find(name);
    const auto object = objects.find(name);
    if (have == actual.paths.end() || object == objects.end())
      continue;
    for (const auto &p : wanted)
      slots[p].creates.push_back(object->second);
    for (const auto &p : have->second)
      slots[p].deletes.push_back(object->second);
  }
  for (const auto &p : actual.extra)
    slots[p].ignore = true;

  std::vector<Change> changes;
  changes.reserve(slots.size());
  for (auto &[path, slot] : slots) {
    if (slot.ignore) {
      changes.push_back(Change{.path = path, .kind = ChangeKind::Ignore});
      continue;
    }
    if (slot.creates.size() > 1 || slot.deletes.size() > 1) {
      throw Error{ErrorKind::AmbiguousManifest, "more than one object claims this path", path};
    }

    const NamedObject *create = slot.creates.empty() ? nullptr : slot.creates.front();
    const NamedObject *remove = slot.deletes.empty() ? nullptr : slot.deletes.front();
    if (create && remove) {
      if (*create == *remove)
        continue; // already in place
      changes.push_back(
          Change{.path = path, .kind = ChangeKind::Modify, .from = *remove, .to = *create});
    } else if (create) {
      changes.push_back(Change{.path = path, .kind = ChangeKind::Create, .to = *create});
    } else if (remove) {
      changes.push_back(Change{.path = path, .kind = ChangeKind::Delete, .from = *remove});
    }
  }
  return changes;
}

void ChangeExecutor::execute(const Change &change) const {
  const auto dst = root_ / change.path;
  switch (change.kind) {
  case ChangeKind::Ignore:
    break;
  case ChangeKind::Delete:
    fs::remove_file(dst);
    break;
  case ChangeKind::Create: {
    if (!change.to)
      throw Error{ErrorKind::InvalidFormat, "create without an object", dst};
    fs::ensure_parent_dir(dst);
    std::error_code ec;
    stdfs::create_hard_link(change.to->path, dst, ec);
    if (ec)
      throw io_error(dst, "link failed", ec);
    break;
  }
  case ChangeKind::Modify:
    if (!change.to)
      throw Error{ErrorKind::InvalidFormat, "modify without an object", dst};
    fs::establish_link(change.to->path, dst);
    break;
  }
}

void ChangeExecutor::execute_all(const std::vector<Change> &changes) const {
  for (const auto &c : changes)
    execute(c);
}

} // namespace hoard
