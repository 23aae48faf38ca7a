#include "hoard/fs.hpp"
#include "hoard/repo.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("hoard_apply_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    const auto repo = hoard::Repository::init(root);
    const auto &r = repo.root();

    write_file(r / "films/movie.mkv", "frames");
    write_file(r / "loose/notes.txt", "untracked");
    (void)repo.ingest_paths({r / "films/movie.mkv"});

    // Nothing redundant yet
    if (!repo.apply().empty()) {
      std::cerr << "apply deleted something in a clean repo\n";
      return 1;
    }

    // A manual second hardlink of a tracked object
    fs::create_directories(r / "stray/dir");
    fs::create_hard_link(r / "films/movie.mkv", r / "stray/dir/movie.mkv");
    // An untracked file hardlinked twice is not ours to touch
    fs::create_hard_link(r / "loose/notes.txt", r / "loose/notes-copy.txt");

    const auto deleted = repo.apply();
    const auto expected_file = r / "stray/dir/movie.mkv";
    if (std::ranges::count(deleted, expected_file) != 1) {
      std::cerr << "redundant link not reported\n";
      return 1;
    }
    if (fs::exists(expected_file) || !fs::exists(r / "films/movie.mkv")) {
      std::cerr << "apply removed the wrong path\n";
      return 1;
    }
    if (fs::exists(r / "stray")) {
      std::cerr << "empty directories left behind\n";
      return 1;
    }
    if (!fs::exists(r / "loose/notes.txt") || !fs::exists(r / "loose/notes-copy.txt")) {
      std::cerr << "untracked files touched\n";
      return 1;
    }
    if (hoard::fs::inode_of(r / "films/movie.mkv") !=
        hoard::fs::inode_of(repo.by_hash_dir() / repo.lookup("movie.mkv")->hash.storage_path())) {
      std::cerr << "canonical link disturbed\n";
      return 1;
    }
    // deleted: the file plus stray/dir/ and stray/
    if (deleted.size() != 3) {
      std::cerr << "expected 3 deletions, got " << deleted.size() << "\n";
      return 1;
    }

    // Links the manifest never mentioned are kept when none is expected
    fs::remove(r / "films/movie.mkv");
    fs::create_directories(r / "a");
    fs::create_directories(r / "b");
    fs::create_hard_link(repo.lookup("movie.mkv")->path, r / "a/movie.mkv");
    fs::create_hard_link(repo.lookup("movie.mkv")->path, r / "b/movie.mkv");
    (void)repo.apply();
    if (!fs::exists(r / "a/movie.mkv") || !fs::exists(r / "b/movie.mkv")) {
      std::cerr << "apply removed the only references\n";
      return 1;
    }

    std::cout << "apply OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
