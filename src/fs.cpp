#include "hoard/fs.hpp"

#include "hoard/error.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <sys/stat.h>

namespace stdfs = std::filesystem;

namespace hoard::fs {

bool exists(const stdfs::path &p) {
  std::error_code ec;
  return stdfs::exists(p, ec);
}

void ensure_parent_dir(const stdfs::path &p) {
  std::error_code ec;
  stdfs::create_directories(p.parent_path(), ec);
  if (ec)
    throw io_error(p.parent_path(), "mkdir -p failed", ec);
}

std::uint64_t inode_of(const stdfs::path &p) {
  struct stat st {};
  if (::stat(p.c_str(), &st) != 0) {
    throw io_error(p, "stat failed", std::error_code(errno, std::generic_category()));
  }
  return static_cast<std::uint64_t>(st.st_ino);
}

std::string read_text(const stdfs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw Error{ErrorKind::Io, "open for read failed", p};
  }
  std::ostringstream os;
  os << ifs.rdbuf();
  if (ifs.bad()) {
    throw Error{ErrorKind::Io, "read failed", p};
  }
  return os.str();
}

void write_file_atomic(const stdfs::path &p, std::string_view data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw Error{ErrorKind::Io, "open temp for write failed", tmp};
    }
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs)
      throw Error{ErrorKind::Io, "flush temp failed", tmp};
  }
  std::error_code ec;
  stdfs::rename(tmp, p, ec);
  if (ec) {
    std::error_code ignored;
    stdfs::remove(tmp, ignored);
    throw io_error(p, "atomic replace failed", ec);
  }
}

void remove_file(const stdfs::path &p) {
  std::error_code ec;
  if (!stdfs::remove(p, ec)) {
    if (!ec)
      ec = std::make_error_code(std::errc::no_such_file_or_directory);
    throw io_error(p, "remove failed", ec);
  }
}

LinkResult establish_link(const stdfs::path &src, const stdfs::path &dst) {
  ensure_parent_dir(dst);

  std::error_code ec;
  if (!stdfs::exists(stdfs::symlink_status(dst, ec))) {
    stdfs::create_hard_link(src, dst, ec);
    if (ec)
      throw io_error(dst, "link failed", ec);
    return LinkResult{.created = true};
  }

  if (inode_of(src) == inode_of(dst)) {
    return LinkResult{.created = false};
  }

  remove_file(dst);
  stdfs::create_hard_link(src, dst, ec);
  if (ec)
    throw io_error(dst, "relink failed", ec);
  return LinkResult{.created = false};
}

std::vector<stdfs::path> prune_empty_dirs(const stdfs::path &root, const stdfs::path &skip) {
  std::vector<stdfs::path> dirs;
  std::error_code ec;
  for (auto it = stdfs::recursive_directory_iterator(root, ec);
       it != stdfs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec)
      throw io_error(root, "walk failed", ec);
    if (it->path() == skip) {
      it.disable_recursion_pending();
      continue;
    }
    if (it->is_directory() && !it->is_symlink())
      dirs.push_back(it->path());
  }
  if (ec)
    throw io_error(root, "walk failed", ec);

  // Longest paths first so children go before their parents.
  std::ranges::sort(dirs, [](const stdfs::path &a, const stdfs::path &b) {
    return a.native().size() > b.native().size();
  });

  std::vector<stdfs::path> removed;
  for (const auto &d : dirs) {
    if (!stdfs::is_empty(d, ec)) {
      if (ec)
        throw io_error(d, "read dir failed", ec);
      continue;
    }
    stdfs::remove(d, ec);
    if (ec)
      throw io_error(d, "rmdir failed", ec);
    removed.push_back(d);
  }
  return removed;
}

bool is_within(const stdfs::path &root, const stdfs::path &p) {
  const auto r = root.lexically_normal();
  const auto n = p.lexically_normal();
  auto rit = r.begin();
  auto nit = n.begin();
  for (; rit != r.end(); ++rit, ++nit) {
    if (rit->empty() && std::next(rit) == r.end())
      break; // trailing separator
    if (nit == n.end() || *rit != *nit)
      return false;
  }
  return true;
}

} // namespace hoard::fs
