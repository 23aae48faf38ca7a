#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace hoard::fs {

bool exists(const std::filesystem::path &p);
void ensure_parent_dir(const std::filesystem::path &p);

// Inode number of `p` (symlinks followed). Throws Error{Io}.
std::uint64_t inode_of(const std::filesystem::path &p);

std::string read_text(const std::filesystem::path &p);
void write_file_atomic(const std::filesystem::path &p, std::string_view data);

// Remove a single file; throws Error{Io} if it is missing or cannot be removed.
void remove_file(const std::filesystem::path &p);

struct LinkResult {
  bool created; // false when dst already existed (same inode, or replaced)
};

/**
 * Make `dst` a hardlink of `src`.
 *  - dst missing:                  link, created = true
 *  - dst shares src's inode:       nothing to do, created = false
 *  - dst is some other file:       remove dst, then link, created = false
 *
 * Parents of dst are created. Removal happens before linking, so the only
 * reference to src's content is never at risk; a crash between the two steps
 * leaves dst missing, which nothing repairs.
 */
LinkResult establish_link(const std::filesystem::path &src, const std::filesystem::path &dst);

// Remove directories under `root` (deepest first) that are empty, skipping `skip`
// and `root` itself. Returns the removed directories.
std::vector<std::filesystem::path> prune_empty_dirs(const std::filesystem::path &root,
                                                    const std::filesystem::path &skip);

// Is `p` (lexically normalized) equal to or below `root`?
bool is_within(const std::filesystem::path &root, const std::filesystem::path &p);

} // namespace hoard::fs
